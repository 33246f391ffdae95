#include <catch2/catch_test_macros.hpp>
#include "include/engine.hpp"
#include "include/errors.hpp"
#include "test_helpers.hpp"
#include <string>

static const std::string standard_csv = "header1,header2,header3\n"
                                        "1,2,3\n"
                                        "4,5,6\n"
                                        "7,8,9\n";

// Runs process_csv_data and returns the column name of the
// HeaderNotFoundError it is expected to raise.
static std::string missing_header(const std::string &csv,
                                  const std::string &selected,
                                  const std::string &filters) {
  try {
    process_csv_data(csv, selected, filters);
  } catch (const HeaderNotFoundError &e) {
    return e.column();
  }
  return "<no error>";
}

TEST_CASE("process_csv_data: identity projection reproduces input",
          "[engine]") {
  REQUIRE(process_csv_data(standard_csv, "", "") == standard_csv);
  REQUIRE(process_csv_data(standard_csv, "header1,header2,header3", "") ==
          standard_csv);

  auto four = read_fixture("four_columns.csv");
  REQUIRE(process_csv_data(four, "", "") == four);
}

TEST_CASE("process_csv_data: greater than and less than", "[engine]") {
  auto csv = read_fixture("four_columns.csv");
  REQUIRE(process_csv_data(csv, "header1,header3,header4",
                           "header1>1\nheader3<10\n") ==
          "header1,header3,header4\n"
          "5,7,8\n");
}

TEST_CASE("process_csv_data: lexical mode compares raw text", "[engine]") {
  auto csv = read_fixture("four_columns.csv");
  ProcessOptions opts;
  opts.compare_mode = CompareMode::Lexical;
  REQUIRE(process_csv_data(csv, "header1,header3,header4",
                           "header1>1\nheader3<10\n", opts) ==
          "header1,header3,header4\n");

  auto labels = read_fixture("labels.csv");
  REQUIRE(process_csv_data(labels, "col1,col3,col4,col7",
                           "col1>l1c1\ncol3>l1c3\n", opts) ==
          "col1,col3,col4,col7\n"
          "l2c1,l2c3,l2c4,l2c7\n"
          "l3c1,l3c3,l3c4,l3c7\n");
}

TEST_CASE("process_csv_data: equals and greater than", "[engine]") {
  REQUIRE(process_csv_data(standard_csv, "header1,header3",
                           "header1=4\nheader2>3\n") ==
          "header1,header3\n"
          "4,6\n");
}

TEST_CASE("process_csv_data: three different filters", "[engine]") {
  REQUIRE(process_csv_data(standard_csv, "header1,header3",
                           "header1>1\nheader2=2\nheader3<6\n") ==
          "header1,header3\n");
}

TEST_CASE("process_csv_data: quotes have no special meaning", "[engine]") {
  auto csv = read_fixture("quoted_header.csv");
  REQUIRE(process_csv_data(csv, "hea\"der1,header3", "hea\"der1>2\n") ==
          "hea\"der1,header3\n"
          "4,6\n"
          "7,9\n");
}

TEST_CASE("process_csv_data: selection order is the output order",
          "[engine]") {
  REQUIRE(process_csv_data(standard_csv, "header3,header1", "") ==
          "header3,header1\n"
          "3,1\n"
          "6,4\n"
          "9,7\n");
  REQUIRE(process_csv_data(standard_csv, " header2 , header1", "") ==
          "header2,header1\n"
          "2,1\n"
          "5,4\n"
          "8,7\n");
}

TEST_CASE("process_csv_data: repeated selection repeats the column",
          "[engine]") {
  REQUIRE(process_csv_data(standard_csv, "header1,header1", "header1<5") ==
          "header1,header1\n"
          "1,1\n"
          "4,4\n");
}

TEST_CASE("process_csv_data: filter order does not matter", "[engine]") {
  REQUIRE(process_csv_data(standard_csv, "", "header2>3\nheader1=4\n") ==
          "header1,header2,header3\n"
          "4,5,6\n");
}

TEST_CASE("process_csv_data: missing selected column", "[engine]") {
  REQUIRE(missing_header(standard_csv, "header3,header4",
                         "header2>3\nheader1=4\n") == "header4");
  REQUIRE_THROWS_AS(process_csv_data(standard_csv, "header3,header4", ""),
                    HeaderNotFoundError);
}

TEST_CASE("process_csv_data: missing filter column", "[engine]") {
  REQUIRE(missing_header(standard_csv, "", "header5=10\n") == "header5");
  REQUIRE(missing_header(standard_csv, "header1", "header2>0\nheader9<3") ==
          "header9");
}

TEST_CASE("process_csv_data: missing column is reported without data rows",
          "[engine]") {
  REQUIRE(missing_header("header1,header2\n", "header3", "") == "header3");
  REQUIRE(missing_header("header1,header2\n", "", "header7=1") == "header7");
}

TEST_CASE("process_csv_data: invalid filter echoes the line", "[engine]") {
  try {
    process_csv_data(standard_csv, "", "header1#2\n");
    FAIL("expected InvalidFilterError");
  } catch (const InvalidFilterError &e) {
    REQUIRE(std::string(e.what()) == "Invalid filter: 'header1#2'");
  }
}

TEST_CASE("process_csv_data: error precedence", "[engine]") {
  // Selection is checked before filters are parsed
  REQUIRE_THROWS_AS(process_csv_data(standard_csv, "header4", "header1#2"),
                    HeaderNotFoundError);
  // Every filter line parses before any filter column is looked up
  REQUIRE_THROWS_AS(process_csv_data(standard_csv, "", "header9=1\nheader1#2"),
                    InvalidFilterError);
}

TEST_CASE("process_csv_data: several filters on one column", "[engine]") {
  REQUIRE(process_csv_data(standard_csv, "",
                           "header1=1\nheader1=4\nheader2>3\nheader3>4\n") ==
          "header1,header2,header3\n");
  REQUIRE(process_csv_data(standard_csv, "", "header1>1\nheader1<7\n") ==
          "header1,header2,header3\n"
          "4,5,6\n");
}

TEST_CASE("process_csv_data: not-equal, at-least and at-most", "[engine]") {
  REQUIRE(process_csv_data(standard_csv, "",
                           "header1!=2\nheader2>=5\nheader3<=6\n") ==
          "header1,header2,header3\n"
          "4,5,6\n");
  REQUIRE(process_csv_data(standard_csv, "header1", "header1!=4\n") ==
          "header1\n"
          "1\n"
          "7\n");
}

TEST_CASE("process_csv_data: integer comparison is numeric", "[engine]") {
  auto csv = read_fixture("crlf.csv");
  REQUIRE(process_csv_data(csv, "id", "qty<0") == "id\n2\n");
  REQUIRE(process_csv_data(csv, "qty", "qty>9") == "qty\n10\n");
  REQUIRE(process_csv_data(csv, "", "qty=+10") == "id,qty\n1,10\n");
}

TEST_CASE("process_csv_data: non-numeric values are fatal", "[engine]") {
  REQUIRE_THROWS_AS(process_csv_data(standard_csv, "", "header1>abc"),
                    NumericParseError);
  REQUIRE_THROWS_AS(process_csv_data(read_fixture("labels.csv"), "",
                                     "col1>l1c1"),
                    NumericParseError);
}

TEST_CASE("process_csv_data: no headers", "[engine]") {
  REQUIRE_THROWS_AS(process_csv_data("", "", ""), NoHeadersError);
  REQUIRE_THROWS_AS(process_csv_data("\n\n", "header1", "header1=1"),
                    NoHeadersError);
  try {
    process_csv_data("", "", "");
  } catch (const CsvError &e) {
    REQUIRE(std::string(e.what()) == "CSV data has no headers");
  }
}

TEST_CASE("process_csv_data: header only input", "[engine]") {
  REQUIRE(process_csv_data("a,b,c", "c,a", "b>1") == "c,a\n");
}

TEST_CASE("process_csv_data: ragged rows", "[engine]") {
  auto csv = read_fixture("ragged.csv");
  // Columns every row has are fine; surplus fields are dropped
  REQUIRE(process_csv_data(csv, "name,id", "") ==
          "name,id\n"
          "ann,1\n"
          "bob,2\n"
          "cy,3\n");
  // Asking a short row for a column it lacks fails the call
  REQUIRE(missing_header(csv, "id,score", "") == "score");
  REQUIRE(missing_header(csv, "id", "score>=0") == "score");
  // Rows dropped by an earlier filter are never projected
  REQUIRE(process_csv_data(csv, "id,score", "id!=2") ==
          "id,score\n"
          "1,90\n"
          "3,75\n");
}

TEST_CASE("process_csv_data: row order decides which lookup fails",
          "[engine]") {
  // Row 1 passes its filter and then lacks "c"; row 2 lacks "b"
  REQUIRE(missing_header("a,b,c\n1,2\n1\n", "c", "b>0") == "c");
  // Row 1 lacks "b" before any row reaches projection
  REQUIRE(missing_header("a,b,c\n1\n1,2\n", "c", "b>0") == "b");
  // A row dropped by its filter is never projected
  REQUIRE(missing_header("a,b,c\n1,0\n1\n", "c", "b>0") == "b");
}

TEST_CASE("process_csv_data: integers beyond 64 bits", "[engine]") {
  const std::string csv = "id,amount\n"
                          "1,99999999999999999999\n"
                          "2,-99999999999999999999\n"
                          "3,5\n";
  REQUIRE(process_csv_data(csv, "id", "amount>1") == "id\n1\n3\n");
  REQUIRE(process_csv_data(csv, "id", "amount<-9223372036854775808") ==
          "id\n2\n");
  REQUIRE(process_csv_data(csv, "id", "amount=099999999999999999999") ==
          "id\n1\n");
}

TEST_CASE("process_csv_data: bare CR line endings", "[engine]") {
  REQUIRE(process_csv_data("a,b\r1,2\r3,4\r", "b", "a>1\r") == "b\n4\n");
}

TEST_CASE("process_csv_data: custom delimiter", "[engine]") {
  ProcessOptions opts;
  opts.delimiter = ';';
  REQUIRE(process_csv_data("a;b\n1;2\n3;4\n", "b,a", "a>1", opts) ==
          "b;a\n"
          "4;3\n");
}

// --- process_csv_file ---

TEST_CASE("process_csv_file: matches the in-memory variant", "[engine]") {
  REQUIRE(process_csv_file(fixture_path("standard.csv"), "header1,header3",
                           "header1=4\nheader2>3") ==
          process_csv_data(standard_csv, "header1,header3",
                           "header1=4\nheader2>3"));

  TempCsv tmp("x,y\n10,20\n30,40\n");
  REQUIRE(process_csv_file(tmp.path(), "y", "x>=30") == "y\n40\n");
}

TEST_CASE("process_csv_file: reads pipes to the end", "[engine]") {
  FilledPipe pipe("x,y\n1,2\n");
  REQUIRE(process_csv_file(pipe.path(), "", "") == "x,y\n1,2\n");
}

TEST_CASE("process_csv_file: unreadable path is a file error", "[engine]") {
  REQUIRE_THROWS_AS(process_csv_file("/nonexistent/dir/data.csv", "", ""),
                    FileAccessError);
  REQUIRE_THROWS_AS(process_csv_file(TEST_DATA_DIR, "", ""), FileAccessError);

  try {
    process_csv_file("/nonexistent/dir/data.csv", "", "");
  } catch (const FileAccessError &e) {
    REQUIRE(e.path() == "/nonexistent/dir/data.csv");
  }
}

TEST_CASE("process_csv_file: empty file has no headers", "[engine]") {
  TempCsv tmp("");
  REQUIRE_THROWS_AS(process_csv_file(tmp.path(), "", ""), NoHeadersError);
}
