#include "include/csv_reader.hpp"
#include "include/delim.hpp"
#include "include/row_parser.hpp"
#include <algorithm>
#include <string>

static std::vector<std::string_view> split_tokens(std::string_view line,
                                                  char delim) {
  std::vector<std::string_view> tokens;
  size_t start = 0;
  while (true) {
    size_t p = line.find(delim, start);
    if (p == std::string_view::npos) {
      tokens.push_back(line.substr(start));
      break;
    }
    tokens.push_back(line.substr(start, p - start));
    start = p + 1;
  }
  return tokens;
}

static std::string join_tokens(const std::vector<std::string_view> &tokens,
                               size_t from, size_t to, char delim) {
  std::string out;
  for (size_t i = from; i < to; ++i) {
    if (i > from)
      out += delim;
    out.append(tokens[i]);
  }
  return out;
}

std::vector<std::string> extract_headers(std::string_view text,
                                         char delimiter) {
  std::string_view line = first_content_line(text);

  std::vector<std::string> headers;
  bool any_named = false;
  if (!line.empty()) {
    for (std::string_view tok : split_tokens(line, delimiter)) {
      headers.push_back(normalize_cell(tok));
      any_named = any_named || !headers.back().empty();
    }
  }
  if (!any_named)
    return std::vector<std::string>(kDefaultColumns.begin(),
                                    kDefaultColumns.end());
  return headers;
}

std::vector<RawRow>
parse_rows_fallback(std::string_view text, char delimiter,
                    const std::vector<std::string> &headers) {
  std::vector<std::string_view> lines;
  for (std::string_view line : split_lines(text)) {
    line = trim(strip_bom(line));
    if (!line.empty())
      lines.push_back(line);
  }

  std::vector<RawRow> rows;
  if (lines.empty() || headers.empty())
    return rows;

  // lines[0] is the header line.
  for (size_t l = 1; l < lines.size(); ++l) {
    std::vector<std::string_view> tokens = split_tokens(lines[l], delimiter);
    size_t ti = 0;
    RawRow row;

    for (size_t h = 0; h < headers.size(); ++h) {
      const std::string &header = headers[h];
      size_t columns_left = headers.size() - h - 1;

      if (columns_left == 0) {
        size_t from = std::min(ti, tokens.size());
        row.set(header,
                normalize_cell(join_tokens(tokens, from, tokens.size(),
                                           delimiter)));
        ti = tokens.size();
        continue;
      }

      if (is_text_column(header)) {
        size_t from = ti;
        while (ti < tokens.size()) {
          ++ti;
          if (tokens.size() - ti <= columns_left)
            break;
        }
        row.set(header,
                normalize_cell(join_tokens(tokens, from, ti, delimiter)));
        continue;
      }

      row.set(header, ti < tokens.size() ? normalize_cell(tokens[ti])
                                         : std::string());
      ++ti;
    }

    rows.push_back(std::move(row));
  }
  return rows;
}
