#ifndef MCSCRIBE_SAVE_SCANNER_H
#define MCSCRIBE_SAVE_SCANNER_H

#include "extractor.h"
#include "region_file.h"
#include "world_version.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mcscribe
{

struct RegionFileEntry
{
  std::filesystem::path path;
  RegionCoords coords;
};

struct ScanResult
{
  WorldVersion version;
  std::vector<SignRecord> signs; // sorted by (x, z, y)
  std::vector<BookRecord> books; // sorted by (x, z, y)
  std::size_t region_files = 0;
};

// One work unit: every chunk of one region file through decode and extract.
// Bad chunks are reported on stderr and skipped; throws RegionError only when
// the file itself cannot be opened.
ExtractionResult extractRegionFile(const RegionFileEntry &entry, WorldVersion version);

// message explaining why save_path cannot be scanned, nullopt if it can
std::optional<std::string> checkSaveFolder(const std::filesystem::path &save_path);

// region files of <save>/region sorted by name, others ignored
std::vector<RegionFileEntry> listRegionFiles(const std::filesystem::path &region_dir);

void sortByPosition(std::vector<SignRecord> &signs);
void sortByPosition(std::vector<BookRecord> &books);

class SaveScanner
{
public:
  // num_threads 0 means one worker per hardware thread
  explicit SaveScanner(const std::filesystem::path &save_path, unsigned int num_threads = 0);
  virtual ~SaveScanner() = default;

  // throws LevelDatError if level.dat cannot be read
  ScanResult scan();

protected:
  // work unit run on the pool, extractRegionFile unless overridden
  virtual ExtractionResult extractRegion(const RegionFileEntry &entry, const WorldVersion &version);

private:
  std::vector<ExtractionResult> processRegionFiles(const std::vector<RegionFileEntry> &files,
                                                   const WorldVersion &version);

  std::filesystem::path save_path;
  unsigned int num_threads;
};

} // namespace mcscribe

#endif
