#ifndef MCSCRIBE_MODIFIED_UTF8_H
#define MCSCRIBE_MODIFIED_UTF8_H

#include <string>

namespace mcscribe
{

// NBT strings are Java modified UTF-8: NUL is stored as C0 80 and code points
// above U+FFFF as two three-byte surrogates. Converts to standard UTF-8; a
// surrogate without its partner becomes U+FFFD.
std::string decodeModifiedUtf8(const std::string &input);

} // namespace mcscribe

#endif
