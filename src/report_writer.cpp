#include "report_writer.h"

#include "diagnostics.h"
#include "text_format.h"

#include <fstream>
#include <iostream>

namespace mcscribe
{

std::string saveName(const std::filesystem::path &save_path)
{
  // "." or "saves/world/.." name the directory they resolve to
  std::filesystem::path resolved = std::filesystem::absolute(save_path).lexically_normal();
  std::filesystem::path name = resolved.filename();
  if (name.empty())
  {
    name = resolved.parent_path().filename();
  }
  return name.string();
}

ReportPaths reportPaths(const std::filesystem::path &output_dir, const std::string &save_name)
{
  return {output_dir / ("signs-" + save_name + ".txt"), output_dir / ("books-" + save_name + ".txt")};
}

void writeSignReport(std::ostream &out, const std::vector<SignRecord> &signs, const WorldVersion &version)
{
  for (const SignRecord &sign : signs)
  {
    out << "========== sign location: " << sign.x << "," << sign.y << "," << sign.z << " ==========\n";

    for (const std::string &line : sign.lines)
    {
      std::string text;
      try
      {
        text = formatSignLine(line, version.isLegacy());
      }
      catch (const TextFormatError &e)
      {
        std::lock_guard<std::mutex> lock(io_mutex);
        std::cerr << "malformed sign text at " << sign.x << "," << sign.y << "," << sign.z << ": "
                  << e.what() << std::endl;
      }
      out << "text: " << text << "\n";
    }
    out << "\n";
  }
}

void writeBookReport(std::ostream &out, const std::vector<BookRecord> &books)
{
  for (const BookRecord &record : books)
  {
    out << "=========== book location: " << record.x << "," << record.y << "," << record.z
        << " ==========\n";

    // writable books have neither title nor author
    const Book &book = record.book;
    out << "title: " << book.title.value_or("unknown") << "\n";
    out << "author: " << book.author.value_or("unknown") << "\n";

    const std::vector<std::string> &pages = *book.pages;
    out << "pages: " << pages.size() << "\n";

    int page_number = 1;
    for (const std::string &page : pages)
    {
      out << "---------- page " << page_number << " ----------\n";
      out << stripFormattingCodes(page) << "\n";
      page_number++;
    }
    out << "\n";
  }
}

ReportPaths writeReports(const std::filesystem::path &output_dir, const std::string &save_name,
                         const ScanResult &scan)
{
  ReportPaths paths = reportPaths(output_dir, save_name);

  std::ofstream signs_file(paths.signs, std::ios::binary | std::ios::trunc);
  if (!signs_file.is_open())
  {
    throw ReportError("cannot create " + paths.signs.string());
  }
  writeSignReport(signs_file, scan.signs, scan.version);
  signs_file.close();
  if (!signs_file)
  {
    throw ReportError("failed writing " + paths.signs.string());
  }

  std::ofstream books_file(paths.books, std::ios::binary | std::ios::trunc);
  if (!books_file.is_open())
  {
    throw ReportError("cannot create " + paths.books.string());
  }
  writeBookReport(books_file, scan.books);
  books_file.close();
  if (!books_file)
  {
    throw ReportError("failed writing " + paths.books.string());
  }

  return paths;
}

} // namespace mcscribe
