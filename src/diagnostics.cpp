#include "diagnostics.h"

namespace mcscribe
{

std::mutex io_mutex;

} // namespace mcscribe
