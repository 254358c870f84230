#include "chunk_schema.h"

#include "modified_utf8.h"

#include <io/stream_reader.h>
#include <new>
#include <sstream>
#include <typeinfo>

namespace mcscribe
{

namespace
{

const nbt::value &requireField(const nbt::tag_compound &compound, const std::string &key)
{
  if (!compound.has_key(key))
  {
    throw ChunkDecodeError("missing field `" + key + "`");
  }
  return compound.at(key);
}

const nbt::tag_compound &requireCompound(const nbt::tag_compound &compound, const std::string &key)
{
  const nbt::value &field = requireField(compound, key);
  if (field.get_type() != nbt::tag_type::Compound)
  {
    throw ChunkDecodeError("field `" + key + "` is not a compound");
  }
  return field.as<nbt::tag_compound>();
}

const nbt::tag_list &requireList(const nbt::tag_compound &compound, const std::string &key)
{
  const nbt::value &field = requireField(compound, key);
  if (field.get_type() != nbt::tag_type::List)
  {
    throw ChunkDecodeError("field `" + key + "` is not a list");
  }
  return field.as<nbt::tag_list>();
}

// bad_cast unless the value is a string tag
std::string stringValue(const nbt::value &field)
{
  return decodeModifiedUtf8(static_cast<const std::string &>(field));
}

std::optional<std::string> optionalString(const nbt::tag_compound &compound, const std::string &key)
{
  if (!compound.has_key(key))
  {
    return std::nullopt;
  }
  const nbt::value &field = compound.at(key);
  if (field.get_type() != nbt::tag_type::String)
  {
    throw ChunkDecodeError("field `" + key + "` is not a string");
  }
  return stringValue(field);
}

int32_t requireInt(const nbt::tag_compound &compound, const std::string &key)
{
  // narrower integer tags widen implicitly in libnbt++
  return static_cast<int32_t>(requireField(compound, key));
}

Book decodeBook(const nbt::tag_compound &tag)
{
  Book book;
  if (tag.has_key("pages"))
  {
    const nbt::tag_list &pages = requireList(tag, "pages");
    std::vector<std::string> texts;
    texts.reserve(pages.size());
    for (const nbt::value &page : pages)
    {
      texts.push_back(stringValue(page));
    }
    book.pages = std::move(texts);
  }
  book.title = optionalString(tag, "title");
  book.author = optionalString(tag, "author");
  return book;
}

std::string decodeItemId(const nbt::value &field)
{
  switch (field.get_type())
  {
  case nbt::tag_type::String:
    return stringValue(field);
  case nbt::tag_type::Short:
    return legacyItemName(field.as<nbt::tag_short>().get());
  default:
    throw ChunkDecodeError("item `id` is neither a string nor a short");
  }
}

Item decodeItem(const nbt::tag_compound &compound)
{
  Item item;
  item.id = decodeItemId(requireField(compound, "id"));
  item.count = static_cast<int8_t>(requireField(compound, "Count"));
  if (compound.has_key("Slot"))
  {
    item.slot = static_cast<int8_t>(compound.at("Slot"));
  }
  if (compound.has_key("tag"))
  {
    item.tag = decodeBook(requireCompound(compound, "tag"));
  }
  return item;
}

BlockEntity decodeBlockEntity(const nbt::tag_compound &compound, ChunkSchema schema)
{
  BlockEntity entity;
  entity.id = stringValue(requireField(compound, "id"));
  entity.x = requireInt(compound, "x");
  entity.y = requireInt(compound, "y");
  entity.z = requireInt(compound, "z");

  static const char *const TEXT_KEYS[4] = {"Text1", "Text2", "Text3", "Text4"};
  bool has_text = false;
  for (int i = 0; i < 4; i++)
  {
    entity.sign_lines[i] = optionalString(compound, TEXT_KEYS[i]);
    has_text = has_text || entity.sign_lines[i].has_value();
  }

  // 1.20 signs keep their lines in front_text.messages
  if (!has_text && schema == ChunkSchema::V1_18 &&
      compound.has_key("front_text", nbt::tag_type::Compound))
  {
    const nbt::tag_compound &front = compound.at("front_text").as<nbt::tag_compound>();
    if (front.has_key("messages"))
    {
      const nbt::tag_list &messages = requireList(front, "messages");
      for (std::size_t i = 0; i < messages.size() && i < 4; i++)
      {
        entity.sign_lines[i] = stringValue(messages.at(i));
      }
    }
  }

  if (compound.has_key("Items"))
  {
    std::vector<Item> items;
    for (const nbt::value &item : requireList(compound, "Items"))
    {
      items.push_back(decodeItem(item.as<nbt::tag_compound>()));
    }
    entity.items = std::move(items);
  }
  return entity;
}

Entity decodeEntity(const nbt::tag_compound &compound)
{
  Entity entity;
  entity.id = stringValue(requireField(compound, "id"));

  const nbt::tag_list &pos = requireList(compound, "Pos");
  if (pos.size() != 3)
  {
    throw ChunkDecodeError("entity `Pos` has " + std::to_string(pos.size()) + " elements, expected 3");
  }
  for (std::size_t i = 0; i < 3; i++)
  {
    entity.pos[i] = static_cast<double>(pos.at(i));
  }

  if (compound.has_key("Item"))
  {
    entity.item = decodeItem(requireCompound(compound, "Item"));
  }
  return entity;
}

void decodeBlockEntities(const nbt::tag_list &list, ChunkSchema schema, ChunkView &view)
{
  view.block_entities.reserve(list.size());
  for (const nbt::value &entry : list)
  {
    view.block_entities.push_back(decodeBlockEntity(entry.as<nbt::tag_compound>(), schema));
  }
}

} // namespace

std::string legacyItemName(int16_t numeric_id)
{
  switch (numeric_id)
  {
  case 340:
    return "minecraft:book";
  case 386:
    return "minecraft:writable_book";
  case 387:
    return "minecraft:written_book";
  case 403:
    return "minecraft:enchanted_book";
  default:
    return std::to_string(numeric_id);
  }
}

ChunkView decodeChunk(const nbt::tag_compound &root, ChunkSchema schema)
{
  ChunkView view;
  try
  {
    switch (schema)
    {
    case ChunkSchema::Legacy:
    {
      const nbt::tag_compound &level = requireCompound(root, "Level");
      decodeBlockEntities(requireList(level, "TileEntities"), schema, view);
      for (const nbt::value &entry : requireList(level, "Entities"))
      {
        view.entities.push_back(decodeEntity(entry.as<nbt::tag_compound>()));
      }
      break;
    }
    case ChunkSchema::V1_17:
    {
      // entities live in the separate entities/ region tree from 1.17 on
      const nbt::tag_compound &level = requireCompound(root, "Level");
      decodeBlockEntities(requireList(level, "TileEntities"), schema, view);
      break;
    }
    case ChunkSchema::V1_18:
      decodeBlockEntities(requireList(root, "block_entities"), schema, view);
      break;
    }
  }
  catch (const std::bad_cast &)
  {
    throw ChunkDecodeError("unexpected tag type");
  }
  catch (const std::out_of_range &e)
  {
    throw ChunkDecodeError(e.what());
  }
  return view;
}

ChunkView decodeChunk(const std::string &nbt_data, ChunkSchema schema)
{
  std::istringstream is(nbt_data);
  std::pair<std::string, std::unique_ptr<nbt::tag_compound>> pair;
  try
  {
    pair = nbt::io::read_compound(is);
  }
  catch (const nbt::io::input_error &e)
  {
    throw ChunkDecodeError(e.what());
  }
  catch (const std::length_error &e)
  {
    throw ChunkDecodeError(std::string("corrupt length field: ") + e.what());
  }
  catch (const std::bad_alloc &)
  {
    throw ChunkDecodeError("corrupt length field: allocation failed");
  }
  return decodeChunk(*pair.second, schema);
}

} // namespace mcscribe
