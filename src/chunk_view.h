#ifndef MCSCRIBE_CHUNK_VIEW_H
#define MCSCRIBE_CHUNK_VIEW_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcscribe
{

// The subset of a chunk's NBT this tool cares about, identical for every save
// format generation. Adapters only fill the fields their schema has.

struct Book
{
  std::optional<std::vector<std::string>> pages;
  std::optional<std::string> title;
  std::optional<std::string> author;
};

struct Item
{
  std::string id;
  int8_t count = 0;
  std::optional<int8_t> slot;
  std::optional<Book> tag;
};

struct BlockEntity
{
  std::string id;
  int32_t x = 0;
  int32_t y = 0;
  int32_t z = 0;
  std::array<std::optional<std::string>, 4> sign_lines;
  std::optional<std::vector<Item>> items;
};

struct Entity
{
  std::string id;
  std::array<double, 3> pos = {0.0, 0.0, 0.0};
  std::optional<Item> item;
};

struct ChunkView
{
  std::vector<BlockEntity> block_entities;
  std::vector<Entity> entities;
};

} // namespace mcscribe

#endif
