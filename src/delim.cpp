#include "include/delim.hpp"
#include "include/csv_reader.hpp"
#include <algorithm>

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (true) {
    size_t nl = text.find('\n', pos);
    size_t end = (nl == std::string_view::npos) ? text.size() : nl;
    size_t actual_end = end;
    if (actual_end > pos && text[actual_end - 1] == '\r')
      --actual_end;
    lines.push_back(text.substr(pos, actual_end - pos));
    if (nl == std::string_view::npos)
      break;
    pos = nl + 1;
  }
  return lines;
}

std::string_view first_content_line(std::string_view text) {
  for (std::string_view line : split_lines(text)) {
    line = strip_bom(line);
    if (!trim(line).empty())
      return line;
  }
  return {};
}

char detect_delimiter(std::string_view text) {
  std::string_view header = first_content_line(text);
  auto commas = std::count(header.begin(), header.end(), ',');
  auto semicolons = std::count(header.begin(), header.end(), ';');

  // Fewer than 5 semicolons cannot be a full question row.
  if (semicolons > commas && semicolons >= 5)
    return ';';
  return ',';
}
