#include "diagnostics.h"
#include "options.h"
#include "report_writer.h"
#include "save_scanner.h"
#include "world_version.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace mcscribe;

int main(int argc, char **argv)
{
  Options options;
  try
  {
    options = parseOptions(argc, argv);
  }
  catch (const OptionsError &e)
  {
    std::cerr << "Error: " << e.what() << "\n" << usage(argv[0]);
    return 1;
  }

  if (options.help)
  {
    std::cout << usage(argv[0]);
    return 0;
  }

  // these three report on stdout and exit cleanly, scripts rely on it
  const std::filesystem::path &save_path = options.save_path;
  if (std::optional<std::string> problem = checkSaveFolder(save_path))
  {
    std::cout << *problem << std::endl;
    return 0;
  }

  try
  {
    SaveScanner scanner(save_path, options.jobs);
    ScanResult result = scanner.scan();

    ReportPaths paths = writeReports(options.output_dir, saveName(save_path), result);

    std::lock_guard<std::mutex> lock(io_mutex);
    std::cerr << "wrote " << result.signs.size() << " signs to " << paths.signs.string() << " and "
              << result.books.size() << " books to " << paths.books.string() << std::endl;
    std::cerr << "done!" << std::endl;
  }
  catch (const LevelDatError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  catch (const ReportError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  catch (const std::filesystem::filesystem_error &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
