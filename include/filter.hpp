#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

class CsvReader;

enum class FilterOp { Neq, Gte, Lte, Eq, Gt, Lt };

enum class CompareMode { Integer, Lexical };

struct Filter {
  std::string column;
  FilterOp op;
  std::string value;
};

// Base-10 integer of any length. `digits` has no leading zeros ("0" for
// zero) and views the text it was parsed from.
struct IntegerText {
  bool negative;
  std::string_view digits;
};

// A filter bound to a header index. `number` is only meaningful in
// CompareMode::Integer.
struct ResolvedFilter {
  const Filter *filter;
  size_t col_idx;
  IntegerText number;
};

Filter parse_filter(std::string_view line);
std::vector<Filter> parse_filters(std::string_view definitions);

IntegerText parse_integer(std::string_view text);
int compare_integers(const IntegerText &a, const IntegerText &b);

std::vector<ResolvedFilter>
resolve_filters(const std::vector<Filter> &filters, const CsvReader &reader,
                CompareMode mode = CompareMode::Integer);

bool row_matches(std::span<const std::string_view> row,
                 const std::vector<ResolvedFilter> &filters,
                 CompareMode mode = CompareMode::Integer);
