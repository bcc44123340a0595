#include "include/question.hpp"
#include "include/csv_reader.hpp"
#include "include/row_parser.hpp"
#include <cmath>
#include <cstdlib>
#include <string>

std::string_view pool_label(QuestionPool pool) {
  switch (pool) {
  case QuestionPool::Tryout:
    return "tryout";
  case QuestionPool::Practice:
    return "latihan";
  }
  return "tryout";
}

bool normalize_boolean(std::string_view value) {
  std::string lower;
  for (char c : trim(value))
    lower += static_cast<char>(c >= 'A' && c <= 'Z' ? c + 32 : c);
  return lower == "true" || lower == "1" || lower == "y";
}

std::optional<double> parse_order(std::string_view value) {
  std::string s(trim(value));
  if (s.empty())
    return std::nullopt;

  // Hex is accepted only as a plain unsigned integer literal.
  if (s.find_first_of("xX") != std::string::npos &&
      (s[0] == '-' || s[0] == '+' ||
       s.find_first_of(".pP") != std::string::npos))
    return std::nullopt;

  char *end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || !std::isfinite(v))
    return std::nullopt;
  return v;
}

static std::optional<std::string> optional_cell(const RawRow &row,
                                                std::string_view key) {
  std::string_view v = trim(row.get(key));
  if (v.empty())
    return std::nullopt;
  return std::string(v);
}

std::vector<ParsedOption> extract_options(const RawRow &row) {
  std::vector<std::string> keys = {"option_a", "option_b", "option_c",
                                   "option_d", "option_e"};
  auto seen = [&](const std::string &k) {
    for (auto &existing : keys)
      if (existing == k)
        return true;
    return false;
  };
  for (auto &cell : row) {
    const std::string &k = cell.first;
    bool is_option = k.rfind("option_", 0) == 0;
    bool is_flag = k.size() >= 8 && k.compare(k.size() - 8, 8, "_correct") == 0;
    if (is_option && !is_flag && !seen(k))
      keys.push_back(k);
  }

  std::vector<ParsedOption> options;
  for (auto &key : keys) {
    std::string_view label = trim(row.get(key));
    if (label.empty())
      continue;
    ParsedOption opt;
    opt.label = std::string(label);
    opt.image_url = optional_cell(row, key + "_image");
    opt.is_correct = normalize_boolean(row.get(key + "_correct"));
    options.push_back(std::move(opt));
  }
  return options;
}

ParsedQuestion assemble_question(const RawRow &row, size_t index,
                                 QuestionPool pool) {
  std::string_view explanation = trim(row.get("explanation"));
  if (explanation.empty())
    throw QuestionError("CSV " + std::string(pool_label(pool)) +
                        ": pembahasan wajib diisi (baris " +
                        std::to_string(index + 2) + ").");

  ParsedQuestion q;
  q.explanation = std::string(explanation);
  q.explanation_image_url = optional_cell(row, "explanationImageUrl");
  if (!q.explanation_image_url)
    q.explanation_image_url = optional_cell(row, "explanation_image");

  q.order = parse_order(row.get("order"))
                .value_or(static_cast<double>(index + 1));

  std::string_view prompt = trim(row.get("prompt"));
  q.prompt = prompt.empty() ? "Soal " + std::to_string(index + 1)
                            : std::string(prompt);
  q.image_url = optional_cell(row, "prompt_image");
  q.options = extract_options(row);
  return q;
}
