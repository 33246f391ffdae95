#include "include/csv_writer.hpp"
#include <cstddef>

template <typename Values>
static void write_line(std::ostream &out, const Values &values,
                       char delimiter) {
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0)
      out << delimiter;
    out << values[i];
  }
  out << "\n";
}

void write_csv(std::ostream &out, const std::vector<std::string> &selected,
               const std::vector<std::vector<std::string_view>> &rows,
               char delimiter) {
  write_line(out, selected, delimiter);
  for (auto &row : rows)
    write_line(out, row, delimiter);
}
