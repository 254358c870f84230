#include "text_format.h"

#include <cctype>
#include <nlohmann/json.hpp>

namespace mcscribe
{

namespace
{

// § encoded as UTF-8
const char SECTION_LEAD = '\xC2';
const char SECTION_TRAIL = '\xA7';

bool isFormattingCode(char c)
{
  char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return (lower >= '0' && lower <= '9') || (lower >= 'a' && lower <= 'f') ||
         (lower >= 'k' && lower <= 'o') || lower == 'r';
}

void appendComponentText(const nlohmann::json &component, std::string &out)
{
  if (component.is_string())
  {
    out += component.get<std::string>();
  }
  else if (component.is_array())
  {
    for (const auto &child : component)
    {
      appendComponentText(child, out);
    }
  }
  else if (component.is_object())
  {
    auto text = component.find("text");
    if (text != component.end())
    {
      // numbers and booleans are valid "text" values too
      out += text->is_string() ? text->get<std::string>() : text->dump();
    }
    auto extra = component.find("extra");
    if (extra != component.end() && extra->is_array())
    {
      for (const auto &child : *extra)
      {
        appendComponentText(child, out);
      }
    }
  }
  else if (component.is_number() || component.is_boolean())
  {
    out += component.dump();
  }
}

} // namespace

std::string flattenTextComponent(const std::string &json_text)
{
  nlohmann::json component;
  try
  {
    component = nlohmann::json::parse(json_text);
  }
  catch (const nlohmann::json::parse_error &e)
  {
    throw TextFormatError(e.what());
  }

  std::string out;
  appendComponentText(component, out);
  return out;
}

std::string formatSignLine(const std::string &raw_line, bool legacy_world)
{
  if (legacy_world)
  {
    return raw_line;
  }
  return flattenTextComponent(raw_line);
}

std::string stripFormattingCodes(const std::string &page)
{
  std::string out;
  out.reserve(page.size());

  std::size_t i = 0;
  while (i < page.size())
  {
    if (page[i] == SECTION_LEAD && i + 1 < page.size() && page[i + 1] == SECTION_TRAIL)
    {
      i += 2;
      if (i < page.size() && isFormattingCode(page[i]))
      {
        i++;
      }
      continue;
    }
    out += page[i];
    i++;
  }
  return out;
}

} // namespace mcscribe
