/**
 * @file csvselectcols.cpp
 * @brief csvselectcols - select or drop CSV columns from stdin to stdout
 */

#include <getopt.h>

#include <exception>
#include <iostream>
#include <string>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "csvcols/csvcols.hpp"

namespace csvcols {
namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(const char *program) {
  std::cerr
      << "Usage: " << program << " [OPTIONS] < input.csv > output.csv\n"
      << "Select columns from a csv file. Read from stdin and write to stdout.\n"
      << "\n"
      << "Options:\n"
      << "  -c, --columns LIST          Comma-separated columns to select/drop\n"
      << "      --complement [BOOL]     Drop the given columns instead\n"
      << "  -i, --input-delimiter C     Delimiter in the input (default ',')\n"
      << "  -o, --output-delimiter C    Delimiter in the output (default: input)\n"
      << "      --in-memory [BOOL]      Load the whole input before writing\n"
      << "  -r, --round N               Round float values to N decimal digits\n"
      << "      --log-level LEVEL       trace, debug, info, warn, error, off\n"
      << "  -h, --help                  Show this help message\n"
      << "      --version               Show version\n"
      << "\n"
      << "BOOL is one of yes/true/t/y/1 or no/false/f/n/0, given as\n"
      << "--flag=BOOL or --flag BOOL. A bare flag means yes.\n";
}

/// Value of an optional-argument flag, either "--flag=value" or
/// "--flag value"; nullptr when the flag stands alone
const char *optional_value(int argc, char *argv[]) {
  if (optarg != nullptr) {
    return optarg;
  }
  if (optind < argc && argv[optind][0] != '-') {
    return argv[optind++];
  }
  return nullptr;
}

int usage_error(const Status &status) {
  std::cerr << "Error: " << status.to_string() << "\n";
  return kExitUsage;
}

enum LongOnlyOption {
  kOptComplement = 256,
  kOptInMemory,
  kOptLogLevel,
  kOptVersion,
};

int run(int argc, char *argv[]) {
  static const option kLongOptions[] = {
      {"columns", required_argument, nullptr, 'c'},
      {"complement", optional_argument, nullptr, kOptComplement},
      {"input-delimiter", required_argument, nullptr, 'i'},
      {"output-delimiter", required_argument, nullptr, 'o'},
      {"in-memory", optional_argument, nullptr, kOptInMemory},
      {"round", required_argument, nullptr, 'r'},
      {"log-level", required_argument, nullptr, kOptLogLevel},
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, kOptVersion},
      {nullptr, 0, nullptr, 0},
  };

  SelectOptions options;
  std::string columns;
  spdlog::level::level_enum log_level = spdlog::level::warn;

  int c;
  while ((c = getopt_long(argc, argv, "c:i:o:r:h", kLongOptions, nullptr)) !=
         -1) {
    Status status;
    switch (c) {
    case 'c':
      columns = optarg;
      break;
    case kOptComplement:
      options.complement = true;
      if (const char *value = optional_value(argc, argv)) {
        status = config::parse_bool(value, &options.complement);
      }
      break;
    case 'i':
      status = config::parse_delimiter(optarg, &options.input_delimiter);
      break;
    case 'o':
      // An empty value keeps the input delimiter
      if (optarg[0] == '\0') {
        options.output_delimiter = '\0';
      } else {
        status = config::parse_delimiter(optarg, &options.output_delimiter);
      }
      break;
    case kOptInMemory:
      options.in_memory = true;
      if (const char *value = optional_value(argc, argv)) {
        status = config::parse_bool(value, &options.in_memory);
      }
      break;
    case 'r':
      status = config::parse_int(optarg, &options.round);
      break;
    case kOptLogLevel:
      status = Logger::parse_level(optarg, &log_level);
      break;
    case 'h':
      print_usage(argv[0]);
      return 0;
    case kOptVersion:
      std::cout << "csvselectcols " << version() << "\n";
      return 0;
    default:
      print_usage(argv[0]);
      return kExitUsage;
    }
    if (!status.ok()) {
      return usage_error(status);
    }
  }

  if (optind < argc) {
    std::cerr << "Error: unexpected argument '" << argv[optind] << "'\n";
    print_usage(argv[0]);
    return kExitUsage;
  }

  Logger::init("csvselectcols", log_level);
  options.columns = config::split_column_list(columns);

  Status status = select_columns(std::cin, std::cout, options);
  if (!status.ok()) {
    std::cout.flush();
    std::cerr << "Error: " << status.to_string() << "\n";
    return kExitFailure;
  }
  return 0;
}

} // namespace
} // namespace csvcols

int main(int argc, char *argv[]) {
  try {
    return csvcols::run(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
