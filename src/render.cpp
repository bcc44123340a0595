#include "include/render.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

std::pair<size_t, size_t> get_terminal_size() {
  struct winsize w;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
    return {w.ws_row, w.ws_col};
  return {24, 80};
}

// Display width in code points; continuation bytes don't count.
static size_t text_width(std::string_view s) {
  size_t n = 0;
  for (char c : s)
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
      ++n;
  return n;
}

static std::string truncate(std::string_view s, size_t max_w) {
  if (text_width(s) <= max_w)
    return std::string(s);
  if (max_w <= 3)
    return std::string(max_w, '.');
  std::string out;
  size_t w = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    bool starts_char = (static_cast<unsigned char>(s[i]) & 0xC0) != 0x80;
    if (starts_char && w == max_w - 3)
      break;
    if (starts_char)
      ++w;
    out += s[i];
  }
  return out + "...";
}

static std::string format_order(double order) {
  std::ostringstream oss;
  if (std::floor(order) == order && std::fabs(order) < 1e15)
    oss << static_cast<long long>(order);
  else
    oss << std::setprecision(15) << order;
  return oss.str();
}

static std::string single_line(std::string_view s) {
  std::string out(s);
  std::replace(out.begin(), out.end(), '\n', ' ');
  std::replace(out.begin(), out.end(), '\r', ' ');
  return out;
}

void render_table(const std::vector<ParsedQuestion> &questions,
                  size_t term_width, std::ostream &out) {
  const char *headers[] = {"order", "prompt", "options", "correct"};
  constexpr size_t ncols = 4;

  std::vector<std::vector<std::string>> cells;
  cells.reserve(questions.size());
  for (auto &q : questions) {
    std::string correct;
    for (size_t i = 0; i < q.options.size(); ++i) {
      if (!q.options[i].is_correct)
        continue;
      if (!correct.empty())
        correct += ",";
      correct += static_cast<char>('A' + std::min<size_t>(i, 25));
    }
    cells.push_back({format_order(q.order), single_line(q.prompt),
                     std::to_string(q.options.size()),
                     correct.empty() ? "-" : correct});
  }

  std::vector<size_t> col_widths(ncols, 0);
  for (size_t c = 0; c < ncols; ++c)
    col_widths[c] = text_width(headers[c]);
  for (auto &row : cells)
    for (size_t c = 0; c < ncols; ++c)
      col_widths[c] = std::max(col_widths[c], text_width(row[c]));

  // Only the prompt column shrinks to fit the terminal.
  size_t total_padding = ncols * 3 + 1;
  size_t fixed = col_widths[0] + col_widths[2] + col_widths[3];
  if (total_padding + fixed + 10 < term_width)
    col_widths[1] =
        std::min(col_widths[1], term_width - total_padding - fixed);

  auto hline = [&](const char *left, const char *mid, const char *right) {
    out << left;
    for (size_t c = 0; c < ncols; ++c) {
      for (size_t i = 0; i < col_widths[c] + 2; ++i)
        out << "\u2500";
      if (c + 1 < ncols)
        out << mid;
    }
    out << right << "\n";
  };

  auto print_row = [&](auto get_val) {
    out << "\u2502";
    for (size_t c = 0; c < ncols; ++c) {
      std::string display = truncate(get_val(c), col_widths[c]);
      size_t pad = col_widths[c] - text_width(display);
      out << " " << display << std::string(pad, ' ') << " \u2502";
    }
    out << "\n";
  };

  hline("\u250C", "\u252C", "\u2510");
  print_row([&](size_t c) { return std::string(headers[c]); });
  hline("\u251C", "\u253C", "\u2524");
  for (auto &row : cells)
    print_row([&](size_t c) { return row[c]; });
  hline("\u2514", "\u2534", "\u2518");

  out << questions.size() << " questions\n";
}

// --- JSON output ---

static std::string json_escape(const std::string &val) {
  std::string result;
  result.reserve(val.size());
  for (char c : val) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
        result += buf;
      } else {
        result += c;
      }
    }
  }
  return result;
}

static std::string json_string(const std::optional<std::string> &val) {
  if (!val)
    return "null";
  return "\"" + json_escape(*val) + "\"";
}

void render_json(const std::vector<ParsedQuestion> &questions,
                 std::ostream &out) {
  out << "[\n";
  for (size_t i = 0; i < questions.size(); ++i) {
    const ParsedQuestion &q = questions[i];
    out << "  {\n";
    out << "    \"prompt\": \"" << json_escape(q.prompt) << "\",\n";
    out << "    \"imageUrl\": " << json_string(q.image_url) << ",\n";
    out << "    \"explanation\": \"" << json_escape(q.explanation) << "\",\n";
    out << "    \"explanationImageUrl\": "
        << json_string(q.explanation_image_url) << ",\n";
    out << "    \"order\": " << format_order(q.order) << ",\n";
    out << "    \"options\": [";
    for (size_t j = 0; j < q.options.size(); ++j) {
      const ParsedOption &o = q.options[j];
      out << (j > 0 ? ",\n" : "\n");
      out << "      {\"label\": \"" << json_escape(o.label)
          << "\", \"imageUrl\": " << json_string(o.image_url)
          << ", \"isCorrect\": " << (o.is_correct ? "true" : "false") << "}";
    }
    out << (q.options.empty() ? "]\n" : "\n    ]\n");
    out << "  }";
    if (i + 1 < questions.size())
      out << ",";
    out << "\n";
  }
  out << "]\n";
}
