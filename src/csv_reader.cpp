#include "include/csv_reader.hpp"
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

// --- Cell utilities ---

std::string unquote(std::string_view field) {
  if (field.size() >= 2 && field.front() == '"' && field.back() == '"') {
    field.remove_prefix(1);
    field.remove_suffix(1);
    std::string result;
    result.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
      if (field[i] == '"' && i + 1 < field.size() && field[i + 1] == '"') {
        result += '"';
        ++i;
      } else {
        result += field[i];
      }
    }
    return result;
  }
  return std::string(field);
}

std::string_view strip_bom(std::string_view value) {
  constexpr std::string_view bom = "\xEF\xBB\xBF";
  if (value.substr(0, bom.size()) == bom)
    value.remove_prefix(bom.size());
  return value;
}

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

std::string_view trim(std::string_view value) {
  while (!value.empty() && is_space(value.front()))
    value.remove_prefix(1);
  while (!value.empty() && is_space(value.back()))
    value.remove_suffix(1);
  return value;
}

std::string normalize_cell(std::string_view value) {
  value = strip_bom(value);
  while (!value.empty() && value.front() == '"')
    value.remove_prefix(1);
  while (!value.empty() && value.back() == '"')
    value.remove_suffix(1);
  return std::string(trim(value));
}

// --- CsvReader implementation ---

CsvReader::CsvReader(const char *file_name) {
  if (std::strcmp(file_name, "-") == 0) {
    read_stdin();
    return;
  }

  this->csv_fd = open(file_name, O_RDONLY);
  if (this->csv_fd < 0)
    throw std::runtime_error("Failed to open csv file");

  struct stat sbuf;
  if (fstat(this->csv_fd, &sbuf) < 0) {
    close(this->csv_fd);
    throw std::runtime_error("Failed to get length of the file");
  }
  this->file_size_ = static_cast<size_t>(sbuf.st_size);

  if (this->file_size_ > 0)
    handle_mmap();
}

void CsvReader::read_stdin() {
  constexpr size_t chunk = 1 << 16; // 64KB
  char buf[chunk];
  ssize_t n;
  while ((n = ::read(STDIN_FILENO, buf, chunk)) > 0)
    stdin_buf_.append(buf, static_cast<size_t>(n));
  if (n < 0)
    throw std::runtime_error("Failed to read stdin");
  if (stdin_buf_.empty())
    return; // same as an empty file
  file_size_ = stdin_buf_.size();
  addr = stdin_buf_.data();
}

void CsvReader::handle_mmap() {
  this->addr =
      mmap(nullptr, this->file_size_, PROT_READ, MAP_PRIVATE, this->csv_fd, 0);
  if (this->addr == MAP_FAILED) {
    this->addr = nullptr;
    close(this->csv_fd);
    throw std::runtime_error("Failed to MMAP file");
  }
}

CsvReader::~CsvReader() {
  if (!stdin_buf_.empty()) {
    // stdin data owned by stdin_buf_, no munmap needed
    addr = nullptr;
  }
  if (addr)
    munmap(addr, file_size_);
  if (csv_fd >= 0)
    close(csv_fd);
}
