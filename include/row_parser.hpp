#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class CsvParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Field count of a record differs from the header's. Recoverable: triggers
// the fallback parser.
class RecordLengthError : public CsvParseError {
public:
  using CsvParseError::CsvParseError;
};

// Header-keyed cells of one input line, in column order. Setting an
// existing key replaces its value and keeps its position.
class RawRow {
  std::vector<std::pair<std::string, std::string>> cells_;

public:
  void set(std::string key, std::string value);
  const std::string *find(std::string_view key) const;
  // Empty when the column is missing.
  std::string_view get(std::string_view key) const;
  bool contains(std::string_view key) const { return find(key) != nullptr; }

  size_t size() const { return cells_.size(); }
  auto begin() const { return cells_.begin(); }
  auto end() const { return cells_.end(); }
};

// Column list used when a file has no usable header line.
constexpr std::array<std::string_view, 20> kDefaultColumns = {
    "prompt",           "prompt_image",     "explanation",
    "explanationImageUrl", "order",         "option_a",
    "option_a_image",   "option_a_correct", "option_b",
    "option_b_image",   "option_b_correct", "option_c",
    "option_c_image",   "option_c_correct", "option_d",
    "option_d_image",   "option_d_correct", "option_e",
    "option_e_image",   "option_e_correct"};

// Free-text columns where stray delimiters are expected.
bool is_text_column(std::string_view name);

struct StrictRows {
  std::vector<std::string> headers;
  std::vector<RawRow> rows;
};

// Quote-aware parse; first non-blank record is the header. Throws
// RecordLengthError on ragged records, CsvParseError on bad quoting.
StrictRows parse_rows_strict(std::string_view text, char delimiter);

// Header names from the first content line, or kDefaultColumns.
std::vector<std::string> extract_headers(std::string_view text,
                                         char delimiter);

// Positional re-split that attributes surplus tokens to text columns.
std::vector<RawRow> parse_rows_fallback(std::string_view text, char delimiter,
                                        const std::vector<std::string> &headers);
