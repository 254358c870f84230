#ifndef MCSCRIBE_EXTRACTOR_H
#define MCSCRIBE_EXTRACTOR_H

#include "chunk_view.h"
#include "world_version.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace mcscribe
{

struct SignRecord
{
  std::string id;
  int32_t x = 0;
  int32_t y = 0;
  int32_t z = 0;
  std::array<std::string, 4> lines; // raw, as stored in the save
};

struct BookRecord
{
  Book book; // pages always present
  int32_t x = 0;
  int32_t y = 0;
  int32_t z = 0;
};

struct ExtractionResult
{
  std::vector<SignRecord> signs;
  std::vector<BookRecord> books;

  void append(ExtractionResult &&other);
};

std::string toLowerAscii(const std::string &text);

// writable_book and written_book qualify, enchanted_book and minecraft:book do not
bool isBookItem(const std::string &item_id);

bool isSignBlockEntity(const std::string &block_entity_id);

// throws ChunkDecodeError when a sign is missing one of its four lines
ExtractionResult extractChunk(const ChunkView &chunk);

} // namespace mcscribe

#endif
