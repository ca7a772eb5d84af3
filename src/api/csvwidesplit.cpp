/**
 * @file csvwidesplit.cpp
 * @brief csvwidesplit - split a wide csv file into column groups
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
      << "Usage: " << program << " [OPTIONS] FILE\n"
      << "Split csv in column groups. Every output file carries the header\n"
      << "and the first column.\n"
      << "\n"
      << "Options:\n"
      << "  -n, --ncols N         Number of columns per chunk (default: all)\n"
      << "  -d, --delimiter C     Csv delimiter (default ',')\n"
      << "  -t, --tex             Convert output chunks to .tex with csv2latex\n"
      << "      --log-level LEVEL trace, debug, info, warn, error, off\n"
      << "  -h, --help            Show this help message\n"
      << "      --version         Show version\n";
}

enum LongOnlyOption {
  kOptLogLevel = 256,
  kOptVersion,
};

int run(int argc, char *argv[]) {
  static const option kLongOptions[] = {
      {"ncols", required_argument, nullptr, 'n'},
      {"delimiter", required_argument, nullptr, 'd'},
      {"tex", no_argument, nullptr, 't'},
      {"log-level", required_argument, nullptr, kOptLogLevel},
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, kOptVersion},
      {nullptr, 0, nullptr, 0},
  };

  SplitOptions options;
  spdlog::level::level_enum log_level = spdlog::level::warn;

  int c;
  while ((c = getopt_long(argc, argv, "n:d:th", kLongOptions, nullptr)) !=
         -1) {
    Status status;
    switch (c) {
    case 'n':
      status = config::parse_int(optarg, &options.ncols);
      break;
    case 'd':
      status = config::parse_delimiter(optarg, &options.delimiter);
      break;
    case 't':
      options.tex = true;
      break;
    case kOptLogLevel:
      status = Logger::parse_level(optarg, &log_level);
      break;
    case 'h':
      print_usage(argv[0]);
      return 0;
    case kOptVersion:
      std::cout << "csvwidesplit " << version() << "\n";
      return 0;
    default:
      print_usage(argv[0]);
      return kExitUsage;
    }
    if (!status.ok()) {
      std::cerr << "Error: " << status.to_string() << "\n";
      return kExitUsage;
    }
  }

  if (optind + 1 != argc) {
    std::cerr << "Error: expected exactly one input file\n";
    print_usage(argv[0]);
    return kExitUsage;
  }
  options.file = argv[optind];

  Logger::init("csvwidesplit", log_level);

  Status status = split_wide(options);
  if (!status.ok()) {
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
