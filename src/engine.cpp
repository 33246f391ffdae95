#include "include/engine.hpp"
#include "include/csv_reader.hpp"
#include "include/csv_writer.hpp"
#include "include/errors.hpp"
#include "include/projection.hpp"
#include <sstream>
#include <vector>

void process_csv(CsvReader &reader, std::string_view selected_columns,
                 std::string_view filter_defs, const ProcessOptions &opts,
                 std::ostream &out) {
  reader.parse(opts.delimiter);
  if (reader.column_count() == 0)
    throw NoHeadersError();

  auto selected = select_headers(selected_columns, reader);
  auto col_indices = resolve_columns(selected, reader);

  auto filters = parse_filters(filter_defs);
  auto resolved = resolve_filters(filters, reader, opts.compare_mode);

  // One row at a time: its filters, then its projection. The first failing
  // lookup in row order is the one reported.
  std::vector<std::vector<std::string_view>> kept;
  for (size_t r = 0; r < reader.row_count(); ++r) {
    auto row = reader.row(r);
    if (row_matches(row, resolved, opts.compare_mode))
      kept.push_back(project_row(row, col_indices, selected));
  }

  // Render into a local buffer so a failure leaves `out` untouched.
  std::ostringstream buf;
  write_csv(buf, selected, kept, opts.delimiter);
  out << buf.str();
}

std::string process_csv_data(std::string_view csv_data,
                             std::string_view selected_columns,
                             std::string_view filter_defs,
                             const ProcessOptions &opts) {
  CsvReader reader(csv_data, CsvSource::Text);
  std::ostringstream out;
  process_csv(reader, selected_columns, filter_defs, opts, out);
  return out.str();
}

std::string process_csv_file(const std::string &path,
                             std::string_view selected_columns,
                             std::string_view filter_defs,
                             const ProcessOptions &opts) {
  CsvReader reader(path, CsvSource::File);
  std::ostringstream out;
  process_csv(reader, selected_columns, filter_defs, opts, out);
  return out.str();
}
