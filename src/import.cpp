#include "include/import.hpp"
#include "include/csv_reader.hpp"
#include "include/delim.hpp"
#include "include/encoding.hpp"
#include "include/row_parser.hpp"

std::string_view parser_name(RowParser p) {
  switch (p) {
  case RowParser::Strict:
    return "strict";
  case RowParser::Fallback:
    return "fallback";
  }
  return "strict";
}

std::vector<RawRow> read_csv_rows(std::string_view bytes,
                                  const EncodingDetector &detector,
                                  ImportTrace *trace) {
  std::string encoding;
  std::string text = decode_bytes(bytes, detector, &encoding);
  char delim = detect_delimiter(text);

  RowParser used = RowParser::Strict;
  std::vector<RawRow> rows;
  try {
    rows = parse_rows_strict(text, delim).rows;
  } catch (const RecordLengthError &) {
    used = RowParser::Fallback;
    rows = parse_rows_fallback(text, delim, extract_headers(text, delim));
  }

  if (trace) {
    trace->encoding = encoding;
    trace->delimiter = delim;
    trace->parser = used;
    trace->row_count = rows.size();
  }
  return rows;
}

std::vector<ParsedQuestion> parse_questions_csv(const char *file_name,
                                                QuestionPool pool,
                                                const EncodingDetector &detector,
                                                ImportTrace *trace) {
  CsvReader reader(file_name);
  std::vector<RawRow> rows = read_csv_rows(reader.bytes(), detector, trace);

  std::vector<ParsedQuestion> questions;
  questions.reserve(rows.size());
  for (size_t i = 0; i < rows.size(); ++i)
    questions.push_back(assemble_question(rows[i], i, pool));
  return questions;
}

std::vector<ParsedQuestion> parse_tryout_csv(const char *file_name,
                                             ImportTrace *trace) {
  IcuEncodingDetector detector;
  return parse_questions_csv(file_name, QuestionPool::Tryout, detector, trace);
}

std::vector<ParsedQuestion> parse_practice_csv(const char *file_name,
                                               ImportTrace *trace) {
  IcuEncodingDetector detector;
  return parse_questions_csv(file_name, QuestionPool::Practice, detector,
                             trace);
}
