#include "byte_order.h"

namespace mcscribe
{

uint32_t readBigEndian24(const uint8_t *buffer)
{
  return (static_cast<uint32_t>(buffer[0]) << 16) |
         (static_cast<uint32_t>(buffer[1]) << 8) |
         static_cast<uint32_t>(buffer[2]);
}

uint32_t readBigEndian32(const uint8_t *buffer)
{
  return (static_cast<uint32_t>(buffer[0]) << 24) |
         (static_cast<uint32_t>(buffer[1]) << 16) |
         (static_cast<uint32_t>(buffer[2]) << 8) |
         static_cast<uint32_t>(buffer[3]);
}

} // namespace mcscribe
