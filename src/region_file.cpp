#include "region_file.h"

#include "byte_order.h"
#include "diagnostics.h"
#include "inflate.h"

#include <iostream>
#include <regex>

namespace mcscribe
{

std::optional<RegionCoords> parseRegionFileName(const std::string &file_name)
{
  static const std::regex pattern(R"(r\.(-?\d+)\.(-?\d+)\.mca)");

  std::smatch match;
  if (!std::regex_match(file_name, match, pattern))
  {
    return std::nullopt;
  }

  try
  {
    RegionCoords coords;
    coords.x = std::stoi(match[1].str());
    coords.z = std::stoi(match[2].str());
    return coords;
  }
  catch (const std::out_of_range &)
  {
    // digits that do not fit an int cannot name a real region
    return std::nullopt;
  }
}

RegionFile::RegionFile(const std::filesystem::path &path, RegionCoords coords)
    : path(path), region(coords)
{
  std::error_code ec;
  file_size = std::filesystem::file_size(path, ec);
  if (ec)
  {
    throw RegionError("cannot stat " + path.string() + ": " + ec.message());
  }

  // an empty region file holds no chunks
  if (file_size == 0)
  {
    return;
  }

  file.open(path, std::ios::binary);
  if (!file.is_open())
  {
    throw RegionError("cannot open " + path.string());
  }

  if (file_size < SECTOR_SIZE)
  {
    std::lock_guard<std::mutex> lock(io_mutex);
    std::cerr << "region " << region.x << ", " << region.z
              << ": file is shorter than the location table, skipping" << std::endl;
    return;
  }

  locations.resize(SECTOR_SIZE);
  if (!file.read(reinterpret_cast<char *>(locations.data()), SECTOR_SIZE))
  {
    throw RegionError("failed to read location table of " + path.string());
  }

  cursor = 0;
}

bool RegionFile::next(RegionChunk &chunk)
{
  while (cursor < CHUNKS_PER_REGION)
  {
    int local_x = cursor / REGION_SIZE;
    int local_z = cursor % REGION_SIZE;
    cursor++;

    if (readChunk(local_x, local_z, chunk))
    {
      return true;
    }
  }
  return false;
}

bool RegionFile::readChunk(int local_x, int local_z, RegionChunk &chunk)
{
  const uint8_t *entry = locations.data() + 4 * (local_x + local_z * REGION_SIZE);
  uint32_t offset = readBigEndian24(entry);
  uint8_t sectors = entry[3];

  if (sectors == 0)
  {
    return false;
  }

  // sectors 0 and 1 hold the location and timestamp tables
  if (offset < 2)
  {
    warn(local_x, local_z, "chunk offset points into the region header");
    return false;
  }

  std::uintmax_t chunk_start = static_cast<std::uintmax_t>(offset) * SECTOR_SIZE;
  if (chunk_start + 5 > file_size)
  {
    warn(local_x, local_z, "chunk lies beyond the end of the file");
    return false;
  }

  file.clear();
  file.seekg(static_cast<std::streamoff>(chunk_start), std::ios::beg);

  uint8_t header[5];
  if (!file.read(reinterpret_cast<char *>(header), sizeof(header)))
  {
    file.clear();
    warn(local_x, local_z, "failed to read chunk header");
    return false;
  }

  uint32_t length = readBigEndian32(header);
  uint8_t compression = header[4];

  if (length <= 1)
  {
    warn(local_x, local_z, "chunk has no payload");
    return false;
  }

  if (chunk_start + 4 + length > file_size)
  {
    warn(local_x, local_z, "chunk length " + std::to_string(length) + " runs past the end of the file");
    return false;
  }

  // the 0x80 bit marks chunks stored in an external .mcc file, which ends up here too
  if (compression != COMPRESSION_ZLIB)
  {
    warn(local_x, local_z, "unsupported compression type: " + std::to_string(compression));
    return false;
  }

  std::string compressed_data(length - 1, '\0');
  if (!file.read(&compressed_data[0], length - 1))
  {
    file.clear();
    warn(local_x, local_z, "failed to read chunk payload");
    return false;
  }

  try
  {
    chunk.nbt_data = decompressZlib(compressed_data);
  }
  catch (const InflateError &e)
  {
    warn(local_x, local_z, e.what());
    return false;
  }

  chunk.local_x = local_x;
  chunk.local_z = local_z;
  return true;
}

void RegionFile::warn(int local_x, int local_z, const std::string &message)
{
  skipped++;
  std::lock_guard<std::mutex> lock(io_mutex);
  std::cerr << "skipping chunk " << local_x << ", " << local_z << " in region "
            << region.x << ", " << region.z << ": " << message << std::endl;
}

} // namespace mcscribe
