#include "include/projection.hpp"
#include "include/csv_reader.hpp"
#include "include/errors.hpp"

std::vector<std::string> select_headers(std::string_view select_str,
                                        const CsvReader &reader) {
  std::vector<std::string> selected;
  if (select_str.empty()) {
    for (auto &h : reader.headers())
      selected.emplace_back(h);
    return selected;
  }

  size_t pos = 0;
  while (true) {
    size_t end = select_str.find(',', pos);
    auto token = select_str.substr(
        pos, end == std::string_view::npos ? std::string_view::npos
                                           : end - pos);
    // Trim whitespace
    size_t start = token.find_first_not_of(" \t");
    size_t last = token.find_last_not_of(" \t");
    if (start == std::string_view::npos)
      token = {};
    else
      token = token.substr(start, last - start + 1);
    selected.emplace_back(token);

    if (end == std::string_view::npos)
      break;
    pos = end + 1;
  }
  return selected;
}

std::vector<size_t> resolve_columns(const std::vector<std::string> &selected,
                                    const CsvReader &reader) {
  std::vector<size_t> indices;
  indices.reserve(selected.size());
  for (auto &name : selected) {
    size_t idx = reader.find_header(name);
    if (idx == CsvReader::npos)
      throw HeaderNotFoundError(name);
    indices.push_back(idx);
  }
  return indices;
}

std::vector<std::string_view>
project_row(std::span<const std::string_view> row,
            const std::vector<size_t> &col_indices,
            const std::vector<std::string> &selected) {
  std::vector<std::string_view> values;
  values.reserve(col_indices.size());
  for (size_t i = 0; i < col_indices.size(); ++i) {
    if (col_indices[i] >= row.size())
      throw HeaderNotFoundError(selected[i]);
    values.push_back(row[col_indices[i]]);
  }
  return values;
}
