#include "save_scanner.h"

#include "chunk_schema.h"
#include "diagnostics.h"

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <tuple>

namespace mcscribe
{

namespace
{

template <typename Record>
bool positionLess(const Record &a, const Record &b)
{
  return std::tie(a.x, a.z, a.y) < std::tie(b.x, b.z, b.y);
}

} // namespace

ExtractionResult extractRegionFile(const RegionFileEntry &entry, WorldVersion version)
{
  ExtractionResult result;
  ChunkSchema schema = selectChunkSchema(version);

  {
    // stderr so piping stdout stays clean
    std::lock_guard<std::mutex> lock(io_mutex);
    std::cerr << "---------- reading region: " << entry.coords.x << ", " << entry.coords.z
              << " ----------" << std::endl;
  }

  RegionFile region(entry.path, entry.coords);
  RegionChunk chunk;
  while (region.next(chunk))
  {
    try
    {
      ChunkView view = decodeChunk(chunk.nbt_data, schema);
      result.append(extractChunk(view));
    }
    catch (const ChunkDecodeError &e)
    {
      std::lock_guard<std::mutex> lock(io_mutex);
      std::cerr << "failed to read nbt in chunk: " << entry.coords.x << ", " << entry.coords.z
                << " with error " << e.what() << " (local chunk " << chunk.local_x << ", "
                << chunk.local_z << ")" << std::endl;
    }
  }

  return result;
}

std::optional<std::string> checkSaveFolder(const std::filesystem::path &save_path)
{
  std::error_code ec;
  if (!std::filesystem::exists(save_path, ec))
  {
    return ec ? "cannot access save folder: " + ec.message() : "save folder does not exist";
  }
  if (!std::filesystem::is_directory(save_path, ec))
  {
    return "save folder is not a directory";
  }
  if (!std::filesystem::exists(save_path / "level.dat", ec))
  {
    return "save version does not exist";
  }
  return std::nullopt;
}

std::vector<RegionFileEntry> listRegionFiles(const std::filesystem::path &region_dir)
{
  std::vector<RegionFileEntry> files;

  std::error_code ec;
  if (!std::filesystem::is_directory(region_dir, ec))
  {
    std::lock_guard<std::mutex> lock(io_mutex);
    std::cerr << "no region directory at " << region_dir.string() << ", nothing to scan" << std::endl;
    return files;
  }

  for (const auto &dir_entry : std::filesystem::directory_iterator(region_dir))
  {
    if (!dir_entry.is_regular_file())
    {
      continue;
    }
    std::optional<RegionCoords> coords = parseRegionFileName(dir_entry.path().filename().string());
    if (!coords)
    {
      continue;
    }
    files.push_back({dir_entry.path(), *coords});
  }

  std::sort(files.begin(), files.end(), [](const RegionFileEntry &a, const RegionFileEntry &b) {
    return a.path.filename() < b.path.filename();
  });
  return files;
}

void sortByPosition(std::vector<SignRecord> &signs)
{
  std::stable_sort(signs.begin(), signs.end(), positionLess<SignRecord>);
}

void sortByPosition(std::vector<BookRecord> &books)
{
  std::stable_sort(books.begin(), books.end(), positionLess<BookRecord>);
}

SaveScanner::SaveScanner(const std::filesystem::path &save_path, unsigned int num_threads)
    : save_path(save_path), num_threads(num_threads)
{
  if (this->num_threads == 0)
  {
    this->num_threads = std::max(1u, std::thread::hardware_concurrency());
  }
}

ExtractionResult SaveScanner::extractRegion(const RegionFileEntry &entry, const WorldVersion &version)
{
  return extractRegionFile(entry, version);
}

std::vector<ExtractionResult> SaveScanner::processRegionFiles(const std::vector<RegionFileEntry> &files,
                                                              const WorldVersion &version)
{
  // one slot per file keeps the merge order independent of scheduling
  std::vector<ExtractionResult> results(files.size());

  std::vector<std::thread> workers;
  std::mutex queue_mutex;
  std::condition_variable cv;
  std::queue<std::size_t> task_queue;
  bool stop = false;

  auto worker_func = [&]() {
    while (true)
    {
      std::size_t task;

      {
        std::unique_lock<std::mutex> lock(queue_mutex);
        cv.wait(lock, [&] { return !task_queue.empty() || stop; });

        if (stop && task_queue.empty())
          return;

        task = task_queue.front();
        task_queue.pop();
      }

      try
      {
        results[task] = extractRegion(files[task], version);
      }
      catch (const RegionError &e)
      {
        std::lock_guard<std::mutex> lock(io_mutex);
        std::cerr << "skipping region " << files[task].coords.x << ", " << files[task].coords.z
                  << ": " << e.what() << std::endl;
      }
      catch (const std::exception &e)
      {
        std::lock_guard<std::mutex> lock(io_mutex);
        std::cerr << "skipping region " << files[task].coords.x << ", " << files[task].coords.z
                  << " after unexpected error: " << e.what() << std::endl;
      }
    }
  };

  unsigned int worker_count =
      static_cast<unsigned int>(std::min<std::size_t>(num_threads, std::max<std::size_t>(files.size(), 1)));
  for (unsigned int i = 0; i < worker_count; ++i)
  {
    workers.emplace_back(worker_func);
  }

  for (std::size_t i = 0; i < files.size(); ++i)
  {
    {
      std::lock_guard<std::mutex> lock(queue_mutex);
      task_queue.push(i);
    }
    cv.notify_one();
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    stop = true;
  }
  cv.notify_all();

  for (auto &worker : workers)
  {
    if (worker.joinable())
    {
      worker.join();
    }
  }

  return results;
}

ScanResult SaveScanner::scan()
{
  ScanResult scan_result;
  scan_result.version = readLevelDat(save_path / "level.dat");

  {
    std::lock_guard<std::mutex> lock(io_mutex);
    std::cout << "world_version: " << scan_result.version.name << " id: " << scan_result.version.id
              << std::endl;
  }

  std::vector<RegionFileEntry> files = listRegionFiles(save_path / "region");
  scan_result.region_files = files.size();

  ExtractionResult merged;
  for (ExtractionResult &result : processRegionFiles(files, scan_result.version))
  {
    merged.append(std::move(result));
  }

  scan_result.signs = std::move(merged.signs);
  scan_result.books = std::move(merged.books);
  sortByPosition(scan_result.signs);
  sortByPosition(scan_result.books);
  return scan_result;
}

} // namespace mcscribe
