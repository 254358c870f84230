#ifndef MCSCRIBE_OPTIONS_H
#define MCSCRIBE_OPTIONS_H

#include <filesystem>
#include <stdexcept>
#include <string>

namespace mcscribe
{

class OptionsError : public std::runtime_error
{
public:
  explicit OptionsError(const std::string &message) : std::runtime_error(message) {}
};

struct Options
{
  std::filesystem::path save_path;
  std::filesystem::path output_dir = ".";
  unsigned int jobs = 0; // 0 = hardware concurrency
  bool help = false;
};

// parses --save/-s, --output/-o, --jobs/-j and --help/-h; throws OptionsError
Options parseOptions(int argc, char **argv);

std::string usage(const std::string &program);

} // namespace mcscribe

#endif
