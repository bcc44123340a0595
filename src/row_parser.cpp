#include "include/row_parser.hpp"
#include "include/csv_reader.hpp"
#include <string>

// --- RawRow ---

void RawRow::set(std::string key, std::string value) {
  for (auto &cell : cells_) {
    if (cell.first == key) {
      cell.second = std::move(value);
      return;
    }
  }
  cells_.emplace_back(std::move(key), std::move(value));
}

const std::string *RawRow::find(std::string_view key) const {
  for (auto &cell : cells_)
    if (cell.first == key)
      return &cell.second;
  return nullptr;
}

std::string_view RawRow::get(std::string_view key) const {
  const std::string *v = find(key);
  return v ? std::string_view(*v) : std::string_view();
}

bool is_text_column(std::string_view name) {
  constexpr std::string_view text_columns[] = {
      "prompt",         "prompt_image",   "explanation",
      "explanationImageUrl", "explanation_image", "option_a",
      "option_a_image", "option_b",       "option_b_image",
      "option_c",       "option_c_image", "option_d",
      "option_d_image", "option_e",       "option_e_image"};
  for (auto c : text_columns)
    if (c == name)
      return true;
  return false;
}

// --- Strict parser ---

namespace {

struct Cursor {
  std::string_view text;
  char delim;
  size_t pos = 0;
  size_t line = 1; // 1-based physical line of pos

  bool at_end() const { return pos >= text.size(); }
  char peek() const { return text[pos]; }
  bool at_record_end() const {
    if (at_end() || text[pos] == '\n')
      return true;
    return text[pos] == '\r' &&
           (pos + 1 == text.size() || text[pos + 1] == '\n');
  }
  void skip_blanks() {
    while (!at_end() && (text[pos] == ' ' || text[pos] == '\t'))
      ++pos;
  }
  void consume_record_end() {
    if (!at_end() && text[pos] == '\r')
      ++pos;
    if (!at_end() && text[pos] == '\n') {
      ++pos;
      ++line;
    }
  }
};

// True (and the cursor moved past it) when the line at the cursor holds
// only whitespace.
bool skip_blank_line(Cursor &cur) {
  size_t nl = cur.text.find('\n', cur.pos);
  size_t end = (nl == std::string_view::npos) ? cur.text.size() : nl;
  if (!trim(cur.text.substr(cur.pos, end - cur.pos)).empty())
    return false;
  cur.pos = end;
  cur.consume_record_end();
  return true;
}

std::string parse_field(Cursor &cur, size_t field_no) {
  cur.skip_blanks();
  if (!cur.at_end() && cur.peek() == '"') {
    size_t fs = cur.pos;
    size_t open_line = cur.line;
    ++cur.pos;
    while (true) {
      if (cur.at_end())
        throw CsvParseError(
            "Quote Not Closed: the parsing is finished with an opening quote "
            "at line " +
            std::to_string(open_line));
      char c = cur.peek();
      if (c == '"') {
        if (cur.pos + 1 < cur.text.size() && cur.text[cur.pos + 1] == '"') {
          cur.pos += 2;
          continue;
        }
        ++cur.pos; // closing quote
        break;
      }
      if (c == '\n')
        ++cur.line;
      ++cur.pos;
    }
    std::string_view quoted = cur.text.substr(fs, cur.pos - fs);
    cur.skip_blanks();
    if (!cur.at_record_end() && cur.peek() != cur.delim)
      throw CsvParseError("Invalid Closing Quote: got \"" +
                          std::string(1, cur.peek()) + "\" at line " +
                          std::to_string(cur.line) +
                          " instead of delimiter or record delimiter");
    return normalize_cell(unquote(quoted));
  }

  size_t fs = cur.pos;
  while (!cur.at_record_end() && cur.peek() != cur.delim) {
    if (cur.peek() == '"')
      throw CsvParseError("Invalid Opening Quote: a quote is found in field " +
                          std::to_string(field_no + 1) + " at line " +
                          std::to_string(cur.line));
    ++cur.pos;
  }
  return normalize_cell(cur.text.substr(fs, cur.pos - fs));
}

std::vector<std::string> parse_record(Cursor &cur) {
  std::vector<std::string> fields;
  while (true) {
    fields.push_back(parse_field(cur, fields.size()));
    if (cur.at_record_end())
      break;
    ++cur.pos; // delimiter
  }
  cur.consume_record_end();
  return fields;
}

} // namespace

StrictRows parse_rows_strict(std::string_view text, char delimiter) {
  StrictRows out;
  Cursor cur{text, delimiter};
  bool have_header = false;

  while (!cur.at_end()) {
    if (skip_blank_line(cur))
      continue;

    size_t record_line = cur.line;
    std::vector<std::string> fields = parse_record(cur);

    if (!have_header) {
      out.headers = std::move(fields);
      have_header = true;
      continue;
    }

    if (fields.size() != out.headers.size())
      throw RecordLengthError("Invalid Record Length: expect " +
                              std::to_string(out.headers.size()) + ", got " +
                              std::to_string(fields.size()) + " on line " +
                              std::to_string(record_line));

    RawRow row;
    for (size_t i = 0; i < fields.size(); ++i)
      row.set(out.headers[i], std::move(fields[i]));
    out.rows.push_back(std::move(row));
  }

  return out;
}
