#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class RawRow;

enum class QuestionPool { Tryout, Practice };

// Label used in error messages: "tryout" or "latihan".
std::string_view pool_label(QuestionPool pool);

class QuestionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ParsedOption {
  std::string label;
  std::optional<std::string> image_url;
  bool is_correct = false;
};

struct ParsedQuestion {
  std::string prompt;
  std::optional<std::string> image_url;
  std::string explanation;
  std::optional<std::string> explanation_image_url;
  double order = 0;
  std::vector<ParsedOption> options;
};

// "true", "1" or "y" after trim + lowercase.
bool normalize_boolean(std::string_view value);

// Finite numeric value of the whole (trimmed) cell, if any.
std::optional<double> parse_order(std::string_view value);

std::vector<ParsedOption> extract_options(const RawRow &row);

// `index` is the 0-based position of the row among data rows. Throws
// QuestionError when the explanation is empty.
ParsedQuestion assemble_question(const RawRow &row, size_t index,
                                 QuestionPool pool);
