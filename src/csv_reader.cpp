#include "include/csv_reader.hpp"
#include "include/errors.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

// --- Line and field scanning ---

// Returns the end of the line starting at `start` and sets `next` to the
// start of the following one. "\n", "\r\n" and a bare "\r" all end a line.
static size_t find_line_end(const char *base, size_t total, size_t start,
                            size_t &next) {
  for (size_t i = start; i < total; ++i) {
    if (base[i] == '\n') {
      next = i + 1;
      return i;
    }
    if (base[i] == '\r') {
      next = (i + 1 < total && base[i + 1] == '\n') ? i + 2 : i + 1;
      return i;
    }
  }
  next = total;
  return total;
}

// Splits [start, end) on every delimiter, keeping at most `limit` fields.
// Quotes get no special treatment.
static void split_fields(const char *base, size_t start, size_t end,
                         char delim, size_t limit,
                         std::vector<std::string_view> &out) {
  size_t added = 0;
  size_t fs = start;
  for (size_t i = start; i < end && added < limit; ++i) {
    if (base[i] == delim) {
      out.emplace_back(base + fs, i - fs);
      ++added;
      fs = i + 1;
    }
  }
  if (added < limit) {
    out.emplace_back(base + fs, end - fs);
  }
}

// --- CsvReader implementation ---

CsvReader::CsvReader(std::string_view input, CsvSource source) {
  if (source == CsvSource::Text) {
    buffer_.assign(input.data(), input.size());
    addr = buffer_.data();
    size_ = buffer_.size();
    return;
  }

  if (input == "-") {
    read_all(STDIN_FILENO, "-");
    return;
  }
  open_file(std::string(input));
}

void CsvReader::open_file(const std::string &path) {
  this->csv_fd = open(path.c_str(), O_RDONLY);
  if (this->csv_fd < 0)
    throw FileAccessError(path, std::strerror(errno));

  struct stat sbuf;
  if (fstat(this->csv_fd, &sbuf) < 0) {
    int err = errno;
    close(this->csv_fd);
    this->csv_fd = -1;
    throw FileAccessError(path, std::strerror(err));
  }
  if (S_ISDIR(sbuf.st_mode)) {
    close(this->csv_fd);
    this->csv_fd = -1;
    throw FileAccessError(path, std::strerror(EISDIR));
  }
  // Pipes, FIFOs and /proc files report no useful size; read them to EOF.
  if (!S_ISREG(sbuf.st_mode)) {
    try {
      read_all(this->csv_fd, path);
    } catch (...) {
      close(this->csv_fd);
      this->csv_fd = -1;
      throw;
    }
    close(this->csv_fd);
    this->csv_fd = -1;
    return;
  }
  this->size_ = static_cast<size_t>(sbuf.st_size);

  if (this->size_ > 0)
    handle_mmap(path);
}

void CsvReader::read_all(int fd, const std::string &path) {
  constexpr size_t chunk = 1 << 16; // 64KB
  char buf[chunk];
  ssize_t n;
  while ((n = ::read(fd, buf, chunk)) > 0)
    buffer_.append(buf, static_cast<size_t>(n));
  if (n < 0) {
    int err = errno;
    throw FileAccessError(path, std::strerror(err));
  }
  size_ = buffer_.size();
  addr = buffer_.data();
}

void CsvReader::handle_mmap(const std::string &path) {
  void *p =
      mmap(nullptr, this->size_, PROT_READ, MAP_PRIVATE, this->csv_fd, 0);
  if (p == MAP_FAILED) {
    int err = errno;
    close(this->csv_fd);
    this->csv_fd = -1;
    throw FileAccessError(path, std::strerror(err));
  }
  this->addr = static_cast<const char *>(p);
  this->mapped_ = true;
}

CsvReader::~CsvReader() {
  if (mapped_)
    munmap(const_cast<char *>(addr), size_);
  if (csv_fd >= 0)
    close(csv_fd);
}

// Returns the offset just past the header line. Leading blank lines are
// skipped; ncols_ stays 0 when there is no header at all.
size_t CsvReader::parse_header(char delimiter) {
  const char *base = data();
  size_t pos = 0;

  while (pos < size_) {
    size_t next;
    size_t line_end = find_line_end(base, size_, pos, next);

    if (line_end > pos) {
      split_fields(base, pos, line_end, delimiter, SIZE_MAX, headers_);
      ncols_ = headers_.size();
      return next;
    }
    pos = next;
  }
  return size_;
}

void CsvReader::append_row_fields(size_t start, size_t end, char delim) {
  row_starts_.push_back(fields_.size());
  split_fields(data(), start, end, delim, ncols_, fields_);
}

void CsvReader::parse(char delimiter) {
  headers_.clear();
  fields_.clear();
  row_starts_.clear();
  ncols_ = 0;

  if (size_ == 0)
    return;

  size_t pos = parse_header(delimiter);
  if (ncols_ == 0)
    return;

  const char *base = data();
  size_t total = size_;

  while (pos < total) {
    size_t next;
    size_t line_end = find_line_end(base, total, pos, next);

    if (line_end > pos)
      append_row_fields(pos, line_end, delimiter);
    pos = next;
  }
}

size_t CsvReader::find_header(std::string_view name) const {
  for (size_t i = 0; i < headers_.size(); ++i) {
    if (headers_[i] == name)
      return i;
  }
  return npos;
}
