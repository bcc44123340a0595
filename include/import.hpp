#pragma once

#include "question.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

class EncodingDetector;
class RawRow;

enum class RowParser { Strict, Fallback };

std::string_view parser_name(RowParser p);

// What the pipeline decided while reading a file.
struct ImportTrace {
  std::string encoding;
  char delimiter = ',';
  RowParser parser = RowParser::Strict;
  size_t row_count = 0;
};

// Decode, detect the delimiter, parse strictly and fall back to the
// heuristic parser only on a record length mismatch.
std::vector<RawRow> read_csv_rows(std::string_view bytes,
                                  const EncodingDetector &detector,
                                  ImportTrace *trace = nullptr);

std::vector<ParsedQuestion> parse_questions_csv(const char *file_name,
                                                QuestionPool pool,
                                                const EncodingDetector &detector,
                                                ImportTrace *trace = nullptr);

std::vector<ParsedQuestion> parse_tryout_csv(const char *file_name,
                                             ImportTrace *trace = nullptr);
std::vector<ParsedQuestion> parse_practice_csv(const char *file_name,
                                               ImportTrace *trace = nullptr);
