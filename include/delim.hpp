#pragma once

#include <string_view>
#include <vector>

// Splits on "\n" and "\r\n". Quotes are not considered.
std::vector<std::string_view> split_lines(std::string_view text);

// First line with non-whitespace content, BOM stripped. Empty if none.
std::string_view first_content_line(std::string_view text);

// ',' unless the first content line has at least 5 semicolons and more
// semicolons than commas.
char detect_delimiter(std::string_view text);
