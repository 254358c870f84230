#ifndef MCSCRIBE_DIAGNOSTICS_H
#define MCSCRIBE_DIAGNOSTICS_H

#include <mutex>

namespace mcscribe
{

// held while writing to std::cout / std::cerr so worker output stays line-atomic
extern std::mutex io_mutex;

} // namespace mcscribe

#endif
