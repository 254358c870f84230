#include "world_version.h"

#include <fstream>
#include <io/izlibstream.h>
#include <io/stream_reader.h>
#include <nbt_tags.h>
#include <typeinfo>

namespace mcscribe
{

ChunkSchema selectChunkSchema(const WorldVersion &version)
{
  if (version.isLegacy() || version.id <= LAST_LEGACY_DATA_VERSION)
  {
    return ChunkSchema::Legacy;
  }
  if (version.id <= LAST_1_17_DATA_VERSION)
  {
    return ChunkSchema::V1_17;
  }
  return ChunkSchema::V1_18;
}

WorldVersion parseLevelDat(const nbt::tag_compound &root)
{
  try
  {
    const nbt::tag_compound &data = root.at("Data").as<nbt::tag_compound>();

    WorldVersion version;
    if (data.has_key("Version", nbt::tag_type::Compound))
    {
      const nbt::tag_compound &modern = data.at("Version").as<nbt::tag_compound>();
      version.id = static_cast<int32_t>(modern.at("Id"));
      version.name = static_cast<const std::string &>(modern.at("Name"));
      version.snapshot = modern.has_key("Snapshot") && static_cast<int8_t>(modern.at("Snapshot")) != 0;
      return version;
    }

    if (!data.has_key("version"))
    {
      throw LevelDatError("unknown world version: level.dat has neither Data.Version nor Data.version");
    }

    version.id = static_cast<int32_t>(data.at("version"));
    version.name = LEGACY_VERSION_NAME;
    version.snapshot = false;
    return version;
  }
  catch (const std::out_of_range &e)
  {
    throw LevelDatError(std::string("level.dat is missing a required field: ") + e.what());
  }
  catch (const std::bad_cast &e)
  {
    throw LevelDatError(std::string("level.dat field has an unexpected type: ") + e.what());
  }
}

WorldVersion readLevelDat(const std::filesystem::path &path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    throw LevelDatError("cannot open " + path.string());
  }

  std::pair<std::string, std::unique_ptr<nbt::tag_compound>> pair;
  try
  {
    zlib::izlibstream gzip_in(file);
    pair = nbt::io::read_compound(gzip_in);
  }
  catch (const std::runtime_error &e)
  {
    throw LevelDatError("failed to read nbt in " + path.string() + ": " + e.what());
  }

  return parseLevelDat(*pair.second);
}

} // namespace mcscribe
