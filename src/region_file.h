#ifndef MCSCRIBE_REGION_FILE_H
#define MCSCRIBE_REGION_FILE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcscribe
{

constexpr int REGION_SIZE = 32;
constexpr std::size_t SECTOR_SIZE = 4096;
constexpr int CHUNKS_PER_REGION = REGION_SIZE * REGION_SIZE;

enum CompressionScheme : uint8_t
{
  COMPRESSION_GZIP = 1,
  COMPRESSION_ZLIB = 2,
  COMPRESSION_NONE = 3
};

class RegionError : public std::runtime_error
{
public:
  explicit RegionError(const std::string &message) : std::runtime_error(message) {}
};

struct RegionCoords
{
  int32_t x = 0;
  int32_t z = 0;
};

// matches r.<rx>.<rz>.mca exactly; anything else is not a region file
std::optional<RegionCoords> parseRegionFileName(const std::string &file_name);

struct RegionChunk
{
  int local_x = 0;
  int local_z = 0;
  std::string nbt_data; // decompressed
};

// Lazily walks the 32x32 chunk grid of an .mca file. Chunks that are absent,
// truncated, use an unsupported compression scheme or fail to inflate are
// skipped with a warning on stderr.
class RegionFile
{
public:
  RegionFile(const std::filesystem::path &path, RegionCoords coords);

  // fills chunk with the next decodable chunk, false once the grid is exhausted
  bool next(RegionChunk &chunk);

  RegionCoords coords() const { return region; }
  std::size_t skippedChunks() const { return skipped; }

private:
  bool readChunk(int local_x, int local_z, RegionChunk &chunk);
  void warn(int local_x, int local_z, const std::string &message);

  std::filesystem::path path;
  RegionCoords region;
  std::ifstream file;
  std::uintmax_t file_size = 0;
  std::vector<uint8_t> locations;
  int cursor = CHUNKS_PER_REGION;
  std::size_t skipped = 0;
};

} // namespace mcscribe

#endif
