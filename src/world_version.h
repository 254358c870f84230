#ifndef MCSCRIBE_WORLD_VERSION_H
#define MCSCRIBE_WORLD_VERSION_H

#include <cstdint>
#include <filesystem>
#include <nbt_tags.h>
#include <stdexcept>
#include <string>

namespace mcscribe
{

class LevelDatError : public std::runtime_error
{
public:
  explicit LevelDatError(const std::string &message) : std::runtime_error(message) {}
};

// name given to the descriptor synthesized for saves without Data.Version
inline const std::string LEGACY_VERSION_NAME = "old";

// last data versions stored in the 1.12-era and 1.17 chunk layouts
constexpr int32_t LAST_LEGACY_DATA_VERSION = 2681;
constexpr int32_t LAST_1_17_DATA_VERSION = 2730;

struct WorldVersion
{
  int32_t id = 0;
  std::string name;
  bool snapshot = false;

  bool isLegacy() const { return name == LEGACY_VERSION_NAME; }
};

enum class ChunkSchema
{
  Legacy, // Level.TileEntities + Level.Entities
  V1_17,  // Level.TileEntities, entities moved to entities/
  V1_18   // block_entities at the root
};

// the synthetic "old" descriptor carries Data.version, which is numerically
// larger than modern data versions, so the name must be checked first
ChunkSchema selectChunkSchema(const WorldVersion &version);

WorldVersion parseLevelDat(const nbt::tag_compound &root);

// reads a gzip compressed level.dat
WorldVersion readLevelDat(const std::filesystem::path &path);

} // namespace mcscribe

#endif
