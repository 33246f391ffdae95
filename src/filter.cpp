#include "include/filter.hpp"
#include "include/csv_reader.hpp"
#include "include/errors.hpp"
#include <string>

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);
  return s;
}

struct OpToken {
  std::string_view token;
  FilterOp op;
};

// Two-character operators come first so ">=" is never read as ">".
static constexpr OpToken op_tokens[] = {
    {"!=", FilterOp::Neq}, {">=", FilterOp::Gte}, {"<=", FilterOp::Lte},
    {"=", FilterOp::Eq},   {">", FilterOp::Gt},   {"<", FilterOp::Lt},
};

Filter parse_filter(std::string_view line) {
  for (auto &op : op_tokens) {
    auto pos = line.find(op.token);
    if (pos != std::string_view::npos) {
      auto col = trim(line.substr(0, pos));
      auto val = trim(line.substr(pos + op.token.size()));
      return {std::string(col), op.op, std::string(val)};
    }
  }

  throw InvalidFilterError(line);
}

std::vector<Filter> parse_filters(std::string_view definitions) {
  std::vector<Filter> filters;
  size_t pos = 0;
  while (pos < definitions.size()) {
    // "\n", "\r\n" and a bare "\r" all end a line
    size_t end = definitions.find_first_of("\r\n", pos);
    if (end == std::string_view::npos)
      end = definitions.size();
    auto line = definitions.substr(pos, end - pos);
    if (!line.empty())
      filters.push_back(parse_filter(line));

    pos = end + 1;
    if (end < definitions.size() && definitions[end] == '\r' &&
        pos < definitions.size() && definitions[pos] == '\n')
      ++pos;
  }
  return filters;
}

IntegerText parse_integer(std::string_view text) {
  auto s = trim(text);
  bool negative = false;
  if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }
  if (s.empty())
    throw NumericParseError(text);
  for (char c : s) {
    if (c < '0' || c > '9')
      throw NumericParseError(text);
  }

  while (s.size() > 1 && s.front() == '0')
    s.remove_prefix(1);
  if (s == "0")
    negative = false;
  return {negative, s};
}

int compare_integers(const IntegerText &a, const IntegerText &b) {
  if (a.negative != b.negative)
    return a.negative ? -1 : 1;

  int magnitude = 0;
  if (a.digits.size() != b.digits.size())
    magnitude = a.digits.size() < b.digits.size() ? -1 : 1;
  else if (int c = a.digits.compare(b.digits); c != 0)
    magnitude = c < 0 ? -1 : 1;

  return a.negative ? -magnitude : magnitude;
}

template <typename T> static bool compare(const T &a, FilterOp op, const T &b) {
  switch (op) {
  case FilterOp::Neq:
    return a != b;
  case FilterOp::Gte:
    return a >= b;
  case FilterOp::Lte:
    return a <= b;
  case FilterOp::Eq:
    return a == b;
  case FilterOp::Gt:
    return a > b;
  case FilterOp::Lt:
    return a < b;
  }
  return false;
}

std::vector<ResolvedFilter> resolve_filters(const std::vector<Filter> &filters,
                                            const CsvReader &reader,
                                            CompareMode mode) {
  std::vector<ResolvedFilter> resolved;
  resolved.reserve(filters.size());

  for (auto &f : filters) {
    size_t idx = reader.find_header(f.column);
    if (idx == CsvReader::npos)
      throw HeaderNotFoundError(f.column);
    resolved.push_back({&f, idx, {false, {}}});
  }

  if (mode == CompareMode::Integer) {
    for (auto &rf : resolved)
      rf.number = parse_integer(rf.filter->value);
  }

  return resolved;
}

bool row_matches(std::span<const std::string_view> row,
                 const std::vector<ResolvedFilter> &filters,
                 CompareMode mode) {
  for (auto &rf : filters) {
    // Short row: the column is not part of this row's header set.
    if (rf.col_idx >= row.size())
      throw HeaderNotFoundError(rf.filter->column);

    std::string_view cell = row[rf.col_idx];
    bool ok = (mode == CompareMode::Integer)
                  ? compare(compare_integers(parse_integer(cell), rf.number),
                            rf.filter->op, 0)
                  : compare(cell, rf.filter->op,
                            std::string_view(rf.filter->value));
    if (!ok)
      return false;
  }
  return true;
}
