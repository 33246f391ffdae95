#include "include/libcsv.h"
#include "include/engine.hpp"
#include "include/errors.hpp"
#include <exception>
#include <iostream>
#include <string>

static void require_input(const char *value, const char *name) {
  if (value == nullptr)
    throw InvalidInputError(name);
}

// Exceptions must not cross the C boundary; the message is the report.
template <typename Fn> static void run_and_print(Fn &&fn) {
  try {
    std::string output = fn();
    std::cout << output;
  } catch (const std::exception &e) {
    std::cout << e.what() << "\n";
  }
  std::cout.flush();
}

void processCsv(const char csv[], const char selectedColumns[],
                const char rowFilterDefinitions[]) {
  run_and_print([&]() {
    require_input(csv, "csv");
    require_input(selectedColumns, "selectedColumns");
    require_input(rowFilterDefinitions, "rowFilterDefinitions");
    return process_csv_data(csv, selectedColumns, rowFilterDefinitions);
  });
}

void processCsvFile(const char csvFilePath[], const char selectedColumns[],
                    const char rowFilterDefinitions[]) {
  run_and_print([&]() {
    require_input(csvFilePath, "csvFilePath");
    require_input(selectedColumns, "selectedColumns");
    require_input(rowFilterDefinitions, "rowFilterDefinitions");
    return process_csv_file(csvFilePath, selectedColumns,
                            rowFilterDefinitions);
  });
}
