#ifndef MCSCRIBE_CHUNK_SCHEMA_H
#define MCSCRIBE_CHUNK_SCHEMA_H

#include "chunk_view.h"
#include "world_version.h"

#include <cstdint>
#include <nbt_tags.h>
#include <stdexcept>
#include <string>

namespace mcscribe
{

class ChunkDecodeError : public std::runtime_error
{
public:
  explicit ChunkDecodeError(const std::string &message) : std::runtime_error(message) {}
};

// Parses raw (already inflated) chunk NBT and maps it into a ChunkView using
// the layout of the given schema. Any structural problem is reported as a
// ChunkDecodeError so the caller can skip just this chunk.
ChunkView decodeChunk(const std::string &nbt_data, ChunkSchema schema);

ChunkView decodeChunk(const nbt::tag_compound &root, ChunkSchema schema);

// pre-1.8 saves store item ids as shorts
std::string legacyItemName(int16_t numeric_id);

} // namespace mcscribe

#endif
