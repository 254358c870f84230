#include "inflate.h"

#include <cstring>
#include <zlib.h>

namespace mcscribe
{

std::string inflateStream(const uint8_t *data, std::size_t size)
{
  const int CHUNK_SIZE = 16384;
  z_stream zs;
  memset(&zs, 0, sizeof(zs));

  if (inflateInit2(&zs, MAX_WBITS) != Z_OK)
  {
    throw InflateError("inflateInit2 failed while decompressing.");
  }

  zs.next_in = const_cast<Bytef *>(data);
  zs.avail_in = static_cast<uInt>(size);

  std::string decompressed_data;
  char outBuffer[CHUNK_SIZE];

  int ret;
  do
  {
    zs.next_out = reinterpret_cast<Bytef *>(outBuffer);
    zs.avail_out = CHUNK_SIZE;

    ret = inflate(&zs, Z_NO_FLUSH);

    if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
        ret == Z_NEED_DICT)
    {
      std::string reason = zs.msg != nullptr ? zs.msg : "unknown error";
      inflateEnd(&zs);
      throw InflateError("Error during zlib decompression: " + reason);
    }

    std::size_t have = CHUNK_SIZE - zs.avail_out;
    decompressed_data.append(outBuffer, have);

    // all input consumed but the stream never ended
    if (ret == Z_BUF_ERROR || (ret != Z_STREAM_END && zs.avail_in == 0 && have == 0))
    {
      inflateEnd(&zs);
      throw InflateError("Compressed stream is truncated.");
    }
  } while (ret != Z_STREAM_END);

  inflateEnd(&zs);

  return decompressed_data;
}

} // namespace mcscribe
