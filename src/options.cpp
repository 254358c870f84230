#include "options.h"

#include <getopt.h>

namespace mcscribe
{

namespace
{

unsigned int parseJobs(const std::string &value)
{
  std::size_t consumed = 0;
  unsigned long jobs = 0;
  try
  {
    jobs = std::stoul(value, &consumed);
  }
  catch (const std::logic_error &)
  {
    throw OptionsError("--jobs expects a positive integer, got '" + value + "'");
  }
  if (consumed != value.size() || jobs == 0 || jobs > 1024 || value[0] == '-')
  {
    throw OptionsError("--jobs expects a positive integer, got '" + value + "'");
  }
  return static_cast<unsigned int>(jobs);
}

// getopt only records the character for short options
std::string offendingOption(char **argv)
{
  if (optopt != 0)
  {
    return std::string("-") + static_cast<char>(optopt);
  }
  return argv[optind - 1];
}

} // namespace

Options parseOptions(int argc, char **argv)
{
  static struct option longoptlist[] = {
      {"save", required_argument, nullptr, 's'},
      {"output", required_argument, nullptr, 'o'},
      {"jobs", required_argument, nullptr, 'j'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, no_argument, nullptr, 0}};

  Options options;
  bool has_save = false;

  // 0 makes glibc reinitialise its scanning state between calls
  optind = 0;
  opterr = 0;

  int option_index = 0;
  int optc;
  while ((optc = getopt_long(argc, argv, ":s:o:j:h", longoptlist, &option_index)) != -1)
  {
    switch (optc)
    {
    case 's':
      options.save_path = optarg;
      has_save = true;
      break;
    case 'o':
      options.output_dir = optarg;
      break;
    case 'j':
      options.jobs = parseJobs(optarg);
      break;
    case 'h':
      options.help = true;
      return options;
    case ':':
      throw OptionsError("missing value for option '" + offendingOption(argv) + "'");
    default:
      throw OptionsError("unknown option '" + offendingOption(argv) + "'");
    }
  }

  if (optind < argc)
  {
    throw OptionsError("unexpected argument '" + std::string(argv[optind]) + "'");
  }
  if (!has_save)
  {
    throw OptionsError("the --save option is required");
  }
  return options;
}

std::string usage(const std::string &program)
{
  return "Usage: " + program + " --save <PATH> [--output <DIR>] [--jobs <N>]\n"
         "  -s, --save <PATH>    minecraft save folder\n"
         "  -o, --output <DIR>   directory for signs-<save>.txt and books-<save>.txt (default .)\n"
         "  -j, --jobs <N>       number of worker threads (default: one per core)\n"
         "  -h, --help           show this help\n";
}

} // namespace mcscribe
