#include "fixtures.h"

#include "region_file.h"

#include <atomic>
#include <fstream>
#include <io/ozlibstream.h>
#include <io/stream_writer.h>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <zlib.h>

namespace mcscribe::fixtures
{

namespace
{

void putBigEndian32(std::string &out, std::size_t offset, uint32_t value)
{
  out[offset] = static_cast<char>((value >> 24) & 0xFF);
  out[offset + 1] = static_cast<char>((value >> 16) & 0xFF);
  out[offset + 2] = static_cast<char>((value >> 8) & 0xFF);
  out[offset + 3] = static_cast<char>(value & 0xFF);
}

std::string compress(const std::string &data, bool gzip)
{
  std::ostringstream temp_stream;
  zlib::ozlibstream zlib_out(temp_stream, Z_DEFAULT_COMPRESSION, gzip);
  zlib_out.write(data.data(), static_cast<std::streamsize>(data.size()));
  zlib_out.close();
  return temp_stream.str();
}

} // namespace

std::string serializeNbt(const nbt::tag_compound &root)
{
  std::ostringstream os;
  nbt::io::write_tag("", root, os);
  return os.str();
}

std::string zlibCompress(const std::string &data)
{
  return compress(data, false);
}

std::string gzipCompress(const std::string &data)
{
  return compress(data, true);
}

RegionBuilder &RegionBuilder::addRaw(int local_x, int local_z, const std::string &payload, uint8_t compression)
{
  entries.push_back({local_x, local_z, payload, compression});
  return *this;
}

RegionBuilder &RegionBuilder::addChunk(int local_x, int local_z, const nbt::tag_compound &chunk)
{
  return addRaw(local_x, local_z, zlibCompress(serializeNbt(chunk)), COMPRESSION_ZLIB);
}

std::string RegionBuilder::build() const
{
  std::string image(2 * SECTOR_SIZE, '\0');

  for (const Entry &entry : entries)
  {
    std::size_t sector = image.size() / SECTOR_SIZE;
    std::string body(5, '\0');
    putBigEndian32(body, 0, static_cast<uint32_t>(entry.payload.size() + 1));
    body[4] = static_cast<char>(entry.compression);
    body += entry.payload;

    std::size_t sectors = (body.size() + SECTOR_SIZE - 1) / SECTOR_SIZE;
    body.resize(sectors * SECTOR_SIZE, '\0');
    image += body;

    std::size_t index = 4 * (entry.local_x + entry.local_z * REGION_SIZE);
    putBigEndian32(image, index, static_cast<uint32_t>((sector << 8) | (sectors & 0xFF)));
  }
  return image;
}

TempDir::TempDir()
{
  static std::atomic<unsigned> counter{0};
  std::random_device rd;
  dir = std::filesystem::temp_directory_path() /
        ("mcscribe-test-" + std::to_string(rd()) + "-" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
}

TempDir::~TempDir()
{
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void writeFile(const std::filesystem::path &path, const std::string &data)
{
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open())
  {
    throw std::runtime_error("cannot create " + path.string());
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

std::string readFile(const std::filesystem::path &path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    throw std::runtime_error("cannot open " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

nbt::tag_compound signEntity(const std::string &id, int32_t x, int32_t y, int32_t z,
                             const std::array<std::string, 4> &lines)
{
  return nbt::tag_compound{
      {"id", id},
      {"x", x},
      {"y", y},
      {"z", z},
      {"Text1", lines[0]},
      {"Text2", lines[1]},
      {"Text3", lines[2]},
      {"Text4", lines[3]}};
}

nbt::tag_compound bookItem(const std::string &id, const std::vector<std::string> &pages,
                           const std::optional<std::string> &title,
                           const std::optional<std::string> &author)
{
  nbt::tag_compound item{{"id", id}, {"Count", nbt::tag_byte(1)}, {"Slot", nbt::tag_byte(0)}};

  nbt::tag_compound tag;
  if (!pages.empty())
  {
    nbt::tag_list page_list;
    for (const std::string &page : pages)
    {
      page_list.push_back(page);
    }
    tag.put("pages", std::move(page_list));
  }
  if (title)
  {
    tag.put("title", *title);
  }
  if (author)
  {
    tag.put("author", *author);
  }
  item.put("tag", std::move(tag));
  return item;
}

nbt::tag_list compoundList(std::vector<nbt::tag_compound> compounds)
{
  nbt::tag_list list;
  for (nbt::tag_compound &compound : compounds)
  {
    list.push_back(std::move(compound));
  }
  return list;
}

nbt::tag_compound container(const std::string &id, int32_t x, int32_t y, int32_t z,
                            std::vector<nbt::tag_compound> items)
{
  nbt::tag_compound chest{{"id", id}, {"x", x}, {"y", y}, {"z", z}};
  chest.put("Items", compoundList(std::move(items)));
  return chest;
}

nbt::tag_compound itemEntity(double x, double y, double z, nbt::tag_compound item)
{
  nbt::tag_list pos;
  pos.push_back(x);
  pos.push_back(y);
  pos.push_back(z);

  nbt::tag_compound entity{{"id", "Item"}};
  entity.put("Pos", std::move(pos));
  entity.put("Item", std::move(item));
  return entity;
}

nbt::tag_compound legacyChunk(std::vector<nbt::tag_compound> tile_entities,
                              std::vector<nbt::tag_compound> entities)
{
  nbt::tag_compound level{{"xPos", 0}, {"zPos", 0}};
  level.put("TileEntities", compoundList(std::move(tile_entities)));
  level.put("Entities", compoundList(std::move(entities)));

  nbt::tag_compound root;
  root.put("Level", std::move(level));
  return root;
}

nbt::tag_compound chunk1_17(std::vector<nbt::tag_compound> tile_entities)
{
  nbt::tag_compound level{{"xPos", 0}, {"zPos", 0}, {"Status", "full"}};
  level.put("TileEntities", compoundList(std::move(tile_entities)));

  nbt::tag_compound root{{"DataVersion", 2730}};
  root.put("Level", std::move(level));
  return root;
}

nbt::tag_compound chunk1_18(std::vector<nbt::tag_compound> block_entities)
{
  nbt::tag_compound root{{"DataVersion", 2975}, {"xPos", 0}, {"zPos", 0}, {"Status", "minecraft:full"}};
  root.put("block_entities", compoundList(std::move(block_entities)));
  root.put("sections", nbt::tag_list());
  return root;
}

nbt::tag_compound modernLevelDat(int32_t id, const std::string &name, bool snapshot)
{
  nbt::tag_compound version{{"Id", id}, {"Name", name}, {"Snapshot", nbt::tag_byte(snapshot ? 1 : 0)}};
  nbt::tag_compound data{{"version", 19133}, {"LevelName", "test world"}};
  data.put("Version", std::move(version));

  nbt::tag_compound root;
  root.put("Data", std::move(data));
  return root;
}

nbt::tag_compound legacyLevelDat(int32_t old_version)
{
  nbt::tag_compound data{{"version", old_version}, {"LevelName", "old world"}};
  nbt::tag_compound root;
  root.put("Data", std::move(data));
  return root;
}

void writeSave(const std::filesystem::path &dir, const nbt::tag_compound &level_dat)
{
  std::filesystem::create_directories(dir / "region");
  writeFile(dir / "level.dat", gzipCompress(serializeNbt(level_dat)));
}

} // namespace mcscribe::fixtures
