#ifndef MCSCRIBE_TEXT_FORMAT_H
#define MCSCRIBE_TEXT_FORMAT_H

#include <stdexcept>
#include <string>

namespace mcscribe
{

class TextFormatError : public std::runtime_error
{
public:
  explicit TextFormatError(const std::string &message) : std::runtime_error(message) {}
};

// Flattens a JSON text component ({"text": ..., "extra": [...]}) into plain
// text, dropping colors and styles. Bare JSON strings and arrays of
// components are accepted as well. Throws TextFormatError on malformed JSON.
std::string flattenTextComponent(const std::string &json_text);

// sign lines of "old" worlds are plain strings, newer worlds store JSON
std::string formatSignLine(const std::string &raw_line, bool legacy_world);

// removes § formatting codes (§0-§9, §a-§f, §k-§o, §r in either case) and
// any leftover bare §
std::string stripFormattingCodes(const std::string &page);

} // namespace mcscribe

#endif
