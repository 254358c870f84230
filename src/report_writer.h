#ifndef MCSCRIBE_REPORT_WRITER_H
#define MCSCRIBE_REPORT_WRITER_H

#include "extractor.h"
#include "save_scanner.h"
#include "world_version.h"

#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcscribe
{

class ReportError : public std::runtime_error
{
public:
  explicit ReportError(const std::string &message) : std::runtime_error(message) {}
};

struct ReportPaths
{
  std::filesystem::path signs;
  std::filesystem::path books;
};

// last path component of the save, ignoring a trailing separator
std::string saveName(const std::filesystem::path &save_path);

ReportPaths reportPaths(const std::filesystem::path &output_dir, const std::string &save_name);

// a sign line that is not valid JSON is written empty with a warning on stderr
void writeSignReport(std::ostream &out, const std::vector<SignRecord> &signs, const WorldVersion &version);

void writeBookReport(std::ostream &out, const std::vector<BookRecord> &books);

// writes signs-<save>.txt and books-<save>.txt, throws ReportError
ReportPaths writeReports(const std::filesystem::path &output_dir, const std::string &save_name,
                         const ScanResult &scan);

} // namespace mcscribe

#endif
