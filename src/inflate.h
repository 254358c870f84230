#ifndef MCSCRIBE_INFLATE_H
#define MCSCRIBE_INFLATE_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace mcscribe
{

class InflateError : public std::runtime_error
{
public:
  explicit InflateError(const std::string &message) : std::runtime_error(message) {}
};

// inflates a complete zlib stream, throws InflateError on corrupt or
// truncated input
std::string inflateStream(const uint8_t *data, std::size_t size);

inline std::string decompressZlib(const std::string &compressed_data)
{
  return inflateStream(reinterpret_cast<const uint8_t *>(compressed_data.data()),
                       compressed_data.size());
}

} // namespace mcscribe

#endif
