#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

// Base of everything the engine throws. what() is the one-line message
// reported back to callers.
class CsvError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class InvalidInputError : public CsvError {
public:
  explicit InvalidInputError(std::string_view param)
      : CsvError("Invalid input: '" + std::string(param) +
                 "' must not be null") {}
};

class NoHeadersError : public CsvError {
public:
  NoHeadersError() : CsvError("CSV data has no headers") {}
};

class HeaderNotFoundError : public CsvError {
  std::string column_;

public:
  explicit HeaderNotFoundError(std::string_view column)
      : CsvError("Header '" + std::string(column) +
                 "' not found in CSV file/string"),
        column_(column) {}

  const std::string &column() const { return column_; }
};

class InvalidFilterError : public CsvError {
  std::string line_;

public:
  explicit InvalidFilterError(std::string_view line)
      : CsvError("Invalid filter: '" + std::string(line) + "'"), line_(line) {}

  const std::string &line() const { return line_; }
};

class NumericParseError : public CsvError {
  std::string text_;

public:
  explicit NumericParseError(std::string_view text)
      : CsvError("Invalid integer value: '" + std::string(text) + "'"),
        text_(text) {}

  const std::string &text() const { return text_; }
};

// Raised only by the file-backed reader; never for content problems.
class FileAccessError : public CsvError {
  std::string path_;

public:
  FileAccessError(std::string_view path, std::string_view reason)
      : CsvError("Failed to read CSV file '" + std::string(path) +
                 "': " + std::string(reason)),
        path_(path) {}

  const std::string &path() const { return path_; }
};
