#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

enum class CsvSource { File, Text };

class CsvReader {
private:
  int csv_fd = -1;
  size_t size_ = 0;
  const char *addr = nullptr;
  bool mapped_ = false;

  std::string buffer_; // owns streamed or in-memory text

  std::vector<std::string_view> headers_;
  std::vector<std::string_view> fields_; // flat, rows may be short
  std::vector<size_t> row_starts_;       // offset into fields_ per row
  size_t ncols_ = 0;

  void open_file(const std::string &path);
  void handle_mmap(const std::string &path);
  void read_all(int fd, const std::string &path);
  size_t parse_header(char delimiter);
  void append_row_fields(size_t start, size_t end, char delim);

public:
  CsvReader() = delete;
  // File: `input` is a path, "-" reads stdin. Text: `input` is the payload.
  CsvReader(std::string_view input, CsvSource source);
  ~CsvReader();
  CsvReader(const CsvReader &) = delete;
  CsvReader &operator=(const CsvReader &) = delete;

  void parse(char delimiter);

  const char *data() const { return addr; }
  size_t size() const { return size_; }
  size_t row_count() const { return row_starts_.size(); }
  size_t column_count() const { return ncols_; }
  const std::vector<std::string_view> &headers() const { return headers_; }

  static constexpr size_t npos = static_cast<size_t>(-1);
  // Index of the first header spelled exactly `name`, or npos.
  size_t find_header(std::string_view name) const;

  std::span<const std::string_view> row(size_t i) const {
    size_t begin = row_starts_[i];
    size_t end =
        (i + 1 < row_starts_.size()) ? row_starts_[i + 1] : fields_.size();
    return {fields_.data() + begin, end - begin};
  }
};
