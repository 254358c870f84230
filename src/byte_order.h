#ifndef MCSCRIBE_BYTE_ORDER_H
#define MCSCRIBE_BYTE_ORDER_H

#include <cstdint>

namespace mcscribe
{

// region files are big endian throughout
uint32_t readBigEndian24(const uint8_t *buffer);
uint32_t readBigEndian32(const uint8_t *buffer);

} // namespace mcscribe

#endif
