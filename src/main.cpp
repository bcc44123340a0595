#include "include/encoding.hpp"
#include "include/import.hpp"
#include "include/render.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

static void print_usage() {
  std::cerr
      << "Usage: examcsv [file.csv | -] [options]\n"
      << "\n"
      << "Options:\n"
      << "  -p, --pool <tryout|practice>  Question pool (default: tryout)\n"
      << "  -f, --format <json|table>     Output format (default: json)\n"
      << "  -e, --encoding <name>         Decode with <name>, skip detection\n"
      << "  -v, --verbose                 Report encoding, delimiter and "
         "parser on stderr\n"
      << "  -h, --help                    Show this help\n"
      << "\n"
      << "Example: examcsv soal.csv --pool practice --format table\n"
      << "Stdin:   cat soal.csv | examcsv - --encoding windows-1252\n";
}

enum class OutputFormat { Json, Table };

int main(int argc, char *argv[]) {
  std::string input_path;
  QuestionPool pool = QuestionPool::Tryout;
  OutputFormat format = OutputFormat::Json;
  std::string encoding;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    if ((std::strcmp(argv[i], "-p") == 0 ||
         std::strcmp(argv[i], "--pool") == 0) &&
        i + 1 < argc) {
      ++i;
      if (std::strcmp(argv[i], "practice") == 0 ||
          std::strcmp(argv[i], "latihan") == 0)
        pool = QuestionPool::Practice;
      else if (std::strcmp(argv[i], "tryout") != 0) {
        std::cerr << "Unknown pool: " << argv[i]
                  << " (use tryout or practice)\n";
        return 1;
      }
    } else if ((std::strcmp(argv[i], "-f") == 0 ||
                std::strcmp(argv[i], "--format") == 0) &&
               i + 1 < argc) {
      ++i;
      if (std::strcmp(argv[i], "table") == 0)
        format = OutputFormat::Table;
      else if (std::strcmp(argv[i], "json") != 0) {
        std::cerr << "Unknown format: " << argv[i] << " (use json or table)\n";
        return 1;
      }
    } else if ((std::strcmp(argv[i], "-e") == 0 ||
                std::strcmp(argv[i], "--encoding") == 0) &&
               i + 1 < argc) {
      encoding = argv[++i];
    } else if (std::strcmp(argv[i], "-v") == 0 ||
               std::strcmp(argv[i], "--verbose") == 0) {
      verbose = true;
    } else if (std::strcmp(argv[i], "-h") == 0 ||
               std::strcmp(argv[i], "--help") == 0) {
      print_usage();
      return 0;
    } else if (argv[i][0] != '-' || std::strcmp(argv[i], "-") == 0) {
      input_path = argv[i];
    } else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      print_usage();
      return 1;
    }
  }

  if (input_path.empty()) {
    if (!isatty(STDIN_FILENO))
      input_path = "-";
    else {
      print_usage();
      return 1;
    }
  }

  std::unique_ptr<EncodingDetector> detector;
  if (encoding.empty())
    detector = std::make_unique<IcuEncodingDetector>();
  else
    detector = std::make_unique<FixedEncodingDetector>(encoding);

  std::vector<ParsedQuestion> questions;
  ImportTrace trace;
  try {
    questions =
        parse_questions_csv(input_path.c_str(), pool, *detector, &trace);
  } catch (const std::exception &e) {
    std::cerr << "Error: CSV soal tidak valid. Gunakan template terbaru dan "
                 "pastikan format kolom sesuai.\n"
              << "Detail: " << e.what() << "\n";
    return 1;
  }

  if (verbose)
    std::cerr << "encoding=" << trace.encoding << " delimiter='"
              << trace.delimiter << "' parser=" << parser_name(trace.parser)
              << " rows=" << trace.row_count << "\n";

  if (questions.empty()) {
    std::cerr << "Error: CSV soal kosong atau tidak valid.\n";
    return 1;
  }

  if (format == OutputFormat::Table)
    render_table(questions, get_terminal_size().second, std::cout);
  else
    render_json(questions, std::cout);

  return 0;
}
