#include <catch2/catch_test_macros.hpp>
#include "include/csv_reader.hpp"
#include "test_helpers.hpp"
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

TEST_CASE("CsvReader: maps the whole file", "[csv_reader]") {
  CsvReader reader(fixture_path("missing_explanation.csv").c_str());
  REQUIRE(reader.data() != nullptr);
  REQUIRE(reader.size() == 124);
  REQUIRE(reader.bytes().size() == reader.size());
  REQUIRE(reader.bytes().substr(0, 7) == "prompt,");
}

TEST_CASE("CsvReader: bytes are returned untouched", "[csv_reader]") {
  TempCsv csv("\xEF\xBB\xBFprompt;explanation\r\n");
  CsvReader reader(csv.path());
  REQUIRE(reader.bytes() == "\xEF\xBB\xBFprompt;explanation\r\n");
}

TEST_CASE("CsvReader: empty file has no bytes", "[csv_reader]") {
  CsvReader reader(fixture_path("empty.csv").c_str());
  REQUIRE(reader.size() == 0);
  REQUIRE(reader.bytes().empty());
}

TEST_CASE("CsvReader: nonexistent file throws", "[csv_reader]") {
  REQUIRE_THROWS_AS(CsvReader("nonexistent_file_xyz.csv"),
                    std::runtime_error);
}

TEST_CASE("CsvReader: empty stdin reads like an empty file", "[csv_reader]") {
  int saved = dup(STDIN_FILENO);
  int fd = open(fixture_path("empty.csv").c_str(), O_RDONLY);
  REQUIRE(saved >= 0);
  REQUIRE(fd >= 0);
  dup2(fd, STDIN_FILENO);
  close(fd);

  size_t size = 1;
  bool empty = false;
  {
    CsvReader reader("-");
    size = reader.size();
    empty = reader.bytes().empty();
  }
  dup2(saved, STDIN_FILENO);
  close(saved);

  REQUIRE(size == 0);
  REQUIRE(empty);
}
