#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

class CsvReader;

// Comma-split, trimmed selection in caller order. An empty selection means
// every header in file order.
std::vector<std::string> select_headers(std::string_view select_str,
                                        const CsvReader &reader);

std::vector<size_t> resolve_columns(const std::vector<std::string> &selected,
                                    const CsvReader &reader);

std::vector<std::string_view>
project_row(std::span<const std::string_view> row,
            const std::vector<size_t> &col_indices,
            const std::vector<std::string> &selected);
