#include "include/csv_reader.hpp"
#include "include/engine.hpp"
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <unistd.h>

static void print_usage() {
  std::cerr
      << "Usage: csvsift [file.csv | -] [options]\n"
      << "\n"
      << "Options:\n"
      << "  -c, --select <col1,col2,...> Output only these columns, in order\n"
      << "  -w, --where <expr>           Filter rows (repeatable, all must "
         "hold)\n"
      << "  -f, --filters <text>         Newline-separated filter lines\n"
      << "  --lexical                    Compare values as strings, not "
         "integers\n"
      << "  -d, --delimiter <c>          Field delimiter (default: ,)\n"
      << "  -h, --help                   Show this help\n"
      << "\n"
      << "Filter operators: !=, >=, <=, =, >, <\n"
      << "Example: csvsift data.csv --select id,total --where \"total>=100\"\n"
      << "Stdin:   cat data.csv | csvsift - --where \"id!=3\"\n";
}

int main(int argc, char *argv[]) {
  std::string input_path;
  std::string select_str;
  std::string filter_defs;
  ProcessOptions opts;

  auto add_filters = [&](const char *text) {
    if (!filter_defs.empty())
      filter_defs += '\n';
    filter_defs += text;
  };

  for (int i = 1; i < argc; ++i) {
    if ((std::strcmp(argv[i], "-c") == 0 ||
         std::strcmp(argv[i], "--select") == 0) &&
        i + 1 < argc) {
      select_str = argv[++i];
    } else if ((std::strcmp(argv[i], "-w") == 0 ||
                std::strcmp(argv[i], "--where") == 0) &&
               i + 1 < argc) {
      add_filters(argv[++i]);
    } else if ((std::strcmp(argv[i], "-f") == 0 ||
                std::strcmp(argv[i], "--filters") == 0) &&
               i + 1 < argc) {
      add_filters(argv[++i]);
    } else if (std::strcmp(argv[i], "--lexical") == 0) {
      opts.compare_mode = CompareMode::Lexical;
    } else if ((std::strcmp(argv[i], "-d") == 0 ||
                std::strcmp(argv[i], "--delimiter") == 0) &&
               i + 1 < argc) {
      ++i;
      if (std::strlen(argv[i]) != 1) {
        std::cerr << "Delimiter must be a single character: " << argv[i]
                  << "\n";
        return 1;
      }
      opts.delimiter = argv[i][0];
    } else if (std::strcmp(argv[i], "-h") == 0 ||
               std::strcmp(argv[i], "--help") == 0) {
      print_usage();
      return 0;
    } else if (argv[i][0] != '-' || std::strcmp(argv[i], "-") == 0) {
      input_path = argv[i];
    } else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      print_usage();
      return 1;
    }
  }

  // Handle stdin: if no path and stdin is piped, read from stdin
  if (input_path.empty()) {
    if (!isatty(STDIN_FILENO))
      input_path = "-";
    else {
      print_usage();
      return 1;
    }
  }

  try {
    CsvReader reader(input_path, CsvSource::File);
    process_csv(reader, select_str, filter_defs, opts, std::cout);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
