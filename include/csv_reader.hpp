#pragma once

#include <cstddef>
#include <string>
#include <string_view>

std::string unquote(std::string_view field);

// Drops a leading U+FEFF (UTF-8 encoded) if present.
std::string_view strip_bom(std::string_view value);

// Cosmetic cleanup applied to every cell: BOM, leading/trailing runs of '"',
// surrounding whitespace.
std::string normalize_cell(std::string_view value);

std::string_view trim(std::string_view value);

// Whole-file, read-only view of an input file ("-" reads stdin).
class CsvReader {
private:
  int csv_fd = -1;
  size_t file_size_ = 0;
  void *addr = nullptr;

  std::string stdin_buf_; // buffer for stdin data

  void handle_mmap();
  void read_stdin();

public:
  CsvReader() = delete;
  CsvReader(const char *file_name);
  ~CsvReader();
  CsvReader(const CsvReader &) = delete;
  CsvReader &operator=(const CsvReader &) = delete;

  const char *data() const { return static_cast<const char *>(addr); }
  size_t size() const { return file_size_; }
  std::string_view bytes() const {
    return addr ? std::string_view(data(), file_size_) : std::string_view();
  }
};
