#include "extractor.h"

#include "chunk_schema.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <limits>

namespace mcscribe
{

namespace
{

bool endsWith(const std::string &text, const std::string &suffix)
{
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// pages present means the item really carries book contents
bool hasPages(const Item &item)
{
  return item.tag.has_value() && item.tag->pages.has_value();
}

// corrupt entities can carry NaN or huge positions, keep the cast defined
int32_t blockCoordinate(double pos)
{
  if (std::isnan(pos))
  {
    return 0;
  }
  double block = std::floor(pos);
  block = std::clamp(block, static_cast<double>(std::numeric_limits<int32_t>::min()),
                     static_cast<double>(std::numeric_limits<int32_t>::max()));
  return static_cast<int32_t>(block);
}

} // namespace

void ExtractionResult::append(ExtractionResult &&other)
{
  signs.insert(signs.end(), std::make_move_iterator(other.signs.begin()),
               std::make_move_iterator(other.signs.end()));
  books.insert(books.end(), std::make_move_iterator(other.books.begin()),
               std::make_move_iterator(other.books.end()));
}

std::string toLowerAscii(const std::string &text)
{
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

bool isBookItem(const std::string &item_id)
{
  std::string id = toLowerAscii(item_id);
  return endsWith(id, "book") && !endsWith(id, "enchanted_book") && !endsWith(id, ":book");
}

bool isSignBlockEntity(const std::string &block_entity_id)
{
  // somewhere between 1.9.4 and 1.12.2 the id changed from "Sign" to "minecraft:sign"
  return endsWith(toLowerAscii(block_entity_id), "sign");
}

ExtractionResult extractChunk(const ChunkView &chunk)
{
  ExtractionResult result;

  for (const BlockEntity &block_entity : chunk.block_entities)
  {
    if (isSignBlockEntity(block_entity.id))
    {
      SignRecord sign;
      sign.id = block_entity.id;
      sign.x = block_entity.x;
      sign.y = block_entity.y;
      sign.z = block_entity.z;
      for (std::size_t i = 0; i < sign.lines.size(); i++)
      {
        if (!block_entity.sign_lines[i])
        {
          throw ChunkDecodeError("sign at " + std::to_string(sign.x) + "," + std::to_string(sign.y) + "," +
                                 std::to_string(sign.z) + " is missing Text" + std::to_string(i + 1));
        }
        sign.lines[i] = *block_entity.sign_lines[i];
      }
      result.signs.push_back(std::move(sign));
    }
    else if (block_entity.items)
    {
      for (const Item &item : *block_entity.items)
      {
        if (isBookItem(item.id) && hasPages(item))
        {
          result.books.push_back({*item.tag, block_entity.x, block_entity.y, block_entity.z});
        }
      }
    }
  }

  // only legacy chunks carry entities
  for (const Entity &entity : chunk.entities)
  {
    if (entity.item && isBookItem(entity.item->id) && hasPages(*entity.item))
    {
      result.books.push_back({*entity.item->tag, blockCoordinate(entity.pos[0]),
                              blockCoordinate(entity.pos[1]), blockCoordinate(entity.pos[2])});
    }
  }

  return result;
}

} // namespace mcscribe
