#include "modified_utf8.h"

#include <cstddef>
#include <cstdint>

namespace mcscribe
{

namespace
{

// decodes the ED xx xx surrogate at data[i], 0 if there is none
uint32_t surrogateAt(const std::string &data, std::size_t i)
{
  if (i + 2 >= data.size() || static_cast<uint8_t>(data[i]) != 0xED)
  {
    return 0;
  }
  uint8_t b1 = static_cast<uint8_t>(data[i + 1]);
  uint8_t b2 = static_cast<uint8_t>(data[i + 2]);
  if (b1 < 0xA0 || b1 > 0xBF || (b2 & 0xC0) != 0x80)
  {
    return 0;
  }
  return 0xD000 | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
}

void appendUtf8(std::string &out, uint32_t code_point)
{
  if (code_point < 0x10000)
  {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
    return;
  }
  out += static_cast<char>(0xF0 | (code_point >> 18));
  out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
  out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
  out += static_cast<char>(0x80 | (code_point & 0x3F));
}

} // namespace

std::string decodeModifiedUtf8(const std::string &input)
{
  std::string out;
  out.reserve(input.size());

  std::size_t i = 0;
  while (i < input.size())
  {
    uint8_t byte = static_cast<uint8_t>(input[i]);

    if (byte == 0xC0 && i + 1 < input.size() && static_cast<uint8_t>(input[i + 1]) == 0x80)
    {
      out += '\0';
      i += 2;
      continue;
    }

    uint32_t high = surrogateAt(input, i);
    if (high == 0)
    {
      out += static_cast<char>(byte);
      i++;
      continue;
    }

    uint32_t low = surrogateAt(input, i + 3);
    if (high <= 0xDBFF && low >= 0xDC00)
    {
      appendUtf8(out, 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00));
      i += 6;
    }
    else
    {
      appendUtf8(out, 0xFFFD);
      i += 3;
    }
  }

  return out;
}

} // namespace mcscribe
