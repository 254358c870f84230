#ifndef MCSCRIBE_TESTS_FIXTURES_H
#define MCSCRIBE_TESTS_FIXTURES_H

#include <array>
#include <cstdint>
#include <filesystem>
#include <nbt_tags.h>
#include <optional>
#include <string>
#include <vector>

namespace mcscribe::fixtures
{

std::string serializeNbt(const nbt::tag_compound &root);
std::string zlibCompress(const std::string &data);
std::string gzipCompress(const std::string &data);

// assembles an .mca image: location table, timestamp table, sector aligned chunks
class RegionBuilder
{
public:
  // payload is written as is after the length and compression byte
  RegionBuilder &addRaw(int local_x, int local_z, const std::string &payload, uint8_t compression);
  RegionBuilder &addChunk(int local_x, int local_z, const nbt::tag_compound &chunk);

  std::string build() const;

private:
  struct Entry
  {
    int local_x;
    int local_z;
    std::string payload;
    uint8_t compression;
  };
  std::vector<Entry> entries;
};

// unique directory under the system temp dir, removed on destruction
class TempDir
{
public:
  TempDir();
  ~TempDir();
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return dir; }

private:
  std::filesystem::path dir;
};

void writeFile(const std::filesystem::path &path, const std::string &data);
std::string readFile(const std::filesystem::path &path);

nbt::tag_compound signEntity(const std::string &id, int32_t x, int32_t y, int32_t z,
                             const std::array<std::string, 4> &lines);

nbt::tag_compound bookItem(const std::string &id, const std::vector<std::string> &pages,
                           const std::optional<std::string> &title = std::nullopt,
                           const std::optional<std::string> &author = std::nullopt);

nbt::tag_compound container(const std::string &id, int32_t x, int32_t y, int32_t z,
                            std::vector<nbt::tag_compound> items);

nbt::tag_compound itemEntity(double x, double y, double z, nbt::tag_compound item);

nbt::tag_list compoundList(std::vector<nbt::tag_compound> compounds);

// chunk roots in each layout
nbt::tag_compound legacyChunk(std::vector<nbt::tag_compound> tile_entities,
                              std::vector<nbt::tag_compound> entities = {});
nbt::tag_compound chunk1_17(std::vector<nbt::tag_compound> tile_entities);
nbt::tag_compound chunk1_18(std::vector<nbt::tag_compound> block_entities);

// level.dat roots
nbt::tag_compound modernLevelDat(int32_t id, const std::string &name, bool snapshot = false);
nbt::tag_compound legacyLevelDat(int32_t old_version);

// lays out <dir>/level.dat and <dir>/region/
void writeSave(const std::filesystem::path &dir, const nbt::tag_compound &level_dat);

} // namespace mcscribe::fixtures

#endif
