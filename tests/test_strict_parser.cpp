#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "include/row_parser.hpp"

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

TEST_CASE("parse_rows_strict: header-keyed quoted row", "[strict]") {
  auto out = parse_rows_strict(
      "prompt,explanation,order,option_a,option_a_correct\n"
      "\"Apa 1+1?\",\"Penjumlahan dasar\",\"1\",\"2\",true\n",
      ',');
  REQUIRE(out.headers.size() == 5);
  REQUIRE(out.rows.size() == 1);
  const RawRow &row = out.rows[0];
  REQUIRE(row.get("prompt") == "Apa 1+1?");
  REQUIRE(row.get("explanation") == "Penjumlahan dasar");
  REQUIRE(row.get("order") == "1");
  REQUIRE(row.get("option_a") == "2");
  REQUIRE(row.get("option_a_correct") == "true");
}

TEST_CASE("parse_rows_strict: keys keep header order", "[strict]") {
  auto out = parse_rows_strict("b,a,c\n1,2,3\n", ',');
  std::vector<std::string> keys;
  for (auto &cell : out.rows[0])
    keys.push_back(cell.first);
  REQUIRE(keys == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("parse_rows_strict: quoted delimiter and newline", "[strict]") {
  auto out = parse_rows_strict("prompt;explanation\n"
                               "\"a;b\";\"baris satu\nbaris dua\"\n",
                               ';');
  REQUIRE(out.rows.size() == 1);
  REQUIRE(out.rows[0].get("prompt") == "a;b");
  REQUIRE(out.rows[0].get("explanation") == "baris satu\nbaris dua");
}

TEST_CASE("parse_rows_strict: doubled quote is a literal quote", "[strict]") {
  auto out = parse_rows_strict("prompt\n\"kata \"\"cerdas\"\" itu\"\n", ',');
  REQUIRE(out.rows[0].get("prompt") == "kata \"cerdas\" itu");
}

TEST_CASE("parse_rows_strict: cells are trimmed", "[strict]") {
  auto out = parse_rows_strict(" prompt , order \n  Soal  ,  \"3\"  \n", ',');
  REQUIRE(out.headers == std::vector<std::string>{"prompt", "order"});
  REQUIRE(out.rows[0].get("prompt") == "Soal");
  REQUIRE(out.rows[0].get("order") == "3");
}

TEST_CASE("parse_rows_strict: blank lines and CRLF", "[strict]") {
  auto out = parse_rows_strict("\r\nprompt,order\r\n\r\n   \r\nA,1\r\n\r\nB,2",
                               ',');
  REQUIRE(out.rows.size() == 2);
  REQUIRE(out.rows[0].get("prompt") == "A");
  REQUIRE(out.rows[1].get("order") == "2");
}

TEST_CASE("parse_rows_strict: trailing delimiter is an empty field",
          "[strict]") {
  auto out = parse_rows_strict("a,b\n1,\n", ',');
  REQUIRE(out.rows[0].get("a") == "1");
  REQUIRE(out.rows[0].contains("b"));
  REQUIRE(out.rows[0].get("b").empty());
}

TEST_CASE("parse_rows_strict: header only or empty input", "[strict]") {
  REQUIRE(parse_rows_strict("prompt,order\n", ',').rows.empty());
  auto empty = parse_rows_strict("", ',');
  REQUIRE(empty.headers.empty());
  REQUIRE(empty.rows.empty());
}

TEST_CASE("parse_rows_strict: repeated header name keeps one key",
          "[strict]") {
  auto out = parse_rows_strict("option_a,option_a\nfirst,second\n", ',');
  REQUIRE(out.rows[0].size() == 1);
  REQUIRE(out.rows[0].get("option_a") == "second");
}

TEST_CASE("parse_rows_strict: extra field is a record length error",
          "[strict]") {
  const char *text = "prompt,explanation,order\n"
                     "Apa?,Penjumlahan, dasar,1\n";
  REQUIRE_THROWS_AS(parse_rows_strict(text, ','), RecordLengthError);
  REQUIRE_THROWS_WITH(parse_rows_strict(text, ','),
                      StartsWith("Invalid Record Length") &&
                          ContainsSubstring("expect 3, got 4 on line 2"));
}

TEST_CASE("parse_rows_strict: missing field is a record length error",
          "[strict]") {
  REQUIRE_THROWS_AS(parse_rows_strict("a,b,c\n1,2\n", ','),
                    RecordLengthError);
}

TEST_CASE("parse_rows_strict: unterminated quote is fatal", "[strict]") {
  const char *text = "prompt,order\n\"Apa 1+1?,1\n";
  try {
    parse_rows_strict(text, ',');
    FAIL("expected CsvParseError");
  } catch (const RecordLengthError &) {
    FAIL("must not be reported as a record length error");
  } catch (const CsvParseError &e) {
    REQUIRE_THAT(e.what(), StartsWith("Quote Not Closed"));
  }
}

TEST_CASE("parse_rows_strict: text after a closing quote is fatal",
          "[strict]") {
  REQUIRE_THROWS_WITH(parse_rows_strict("a,b\n\"x\"y,1\n", ','),
                      StartsWith("Invalid Closing Quote"));
}

TEST_CASE("parse_rows_strict: quote inside an unquoted field is fatal",
          "[strict]") {
  REQUIRE_THROWS_WITH(parse_rows_strict("a,b\nab\"c,1\n", ','),
                      StartsWith("Invalid Opening Quote") &&
                          ContainsSubstring("field 1 at line 2"));
}

TEST_CASE("parse_rows_strict: first error in file order wins", "[strict]") {
  // Line 2 is ragged before line 3's bad quote is reached
  REQUIRE_THROWS_AS(parse_rows_strict("a,b\n1,2,3\n\"x,1\n", ','),
                    RecordLengthError);
}
