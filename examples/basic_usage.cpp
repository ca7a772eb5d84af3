/**
 * @file basic_usage.cpp
 * @brief Basic usage example for csvcols
 */

#include <iostream>
#include <sstream>

#include <csvcols/csvcols.hpp>

int main() {
    std::cout << "csvcols v" << csvcols::version() << "\n\n";

    std::istringstream in(
        "# measured values\n"
        "sample,temperature,pressure,note\n"
        "a,21.3456,101.325,ok\n"
        "b,19.9991,99.87,\"recal, pending\"\n");

    // Keep two columns, rounded to one decimal
    csvcols::SelectOptions options;
    options.columns = {"temperature", "sample"};
    options.round = 1;

    std::ostringstream out;
    auto status = csvcols::select_columns(in, out, options);
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << "\n";
        return 1;
    }
    std::cout << out.str() << "\n";

    // Asking for a column that does not exist reports every missing name
    in.clear();
    in.seekg(0);
    options.columns = {"sample", "humidity"};
    std::ostringstream ignored;
    status = csvcols::select_columns(in, ignored, options);
    std::cout << "Missing column: " << status.to_string() << "\n";

    return 0;
}
