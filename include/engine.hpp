#pragma once

#include "filter.hpp"
#include <ostream>
#include <string>
#include <string_view>

class CsvReader;

struct ProcessOptions {
  CompareMode compare_mode = CompareMode::Integer;
  char delimiter = ',';
};

// Parses `reader`, keeps rows matching every line of `filter_defs` and
// writes the `selected_columns` projection to `out`. Throws a CsvError
// subclass before anything is written if the call cannot succeed up front.
void process_csv(CsvReader &reader, std::string_view selected_columns,
                 std::string_view filter_defs, const ProcessOptions &opts,
                 std::ostream &out);

std::string process_csv_data(std::string_view csv_data,
                             std::string_view selected_columns,
                             std::string_view filter_defs,
                             const ProcessOptions &opts = {});

// Reads the whole file at `path` ("-" for stdin), then behaves like
// process_csv_data. Unreadable paths throw FileAccessError.
std::string process_csv_file(const std::string &path,
                             std::string_view selected_columns,
                             std::string_view filter_defs,
                             const ProcessOptions &opts = {});
