#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// Writes the selected header line and one line per projected row. Values
// are written literally, without quoting.
void write_csv(std::ostream &out, const std::vector<std::string> &selected,
               const std::vector<std::vector<std::string_view>> &rows,
               char delimiter);
