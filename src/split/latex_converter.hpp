#pragma once

/**
 * @file latex_converter.hpp
 * @brief csv2latex subprocess converter
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "split/converter.hpp"

namespace csvcols {

/**
 * @brief csv2latex separator code for a delimiter
 *
 * ',' -> 'c', ';' -> 's', tab -> 't', ' ' -> 'p', ':' -> 'l'.
 */
[[nodiscard]] std::optional<char> latex_separator_code(char delimiter) noexcept;

/**
 * @brief Converter that runs csv2latex and captures its standard output
 *
 * The program is started with fork/exec and searched on PATH. A non-zero
 * exit status fails the conversion.
 */
class LatexConverter : public Converter {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /// Only create() can build the key, so the separator is always valid
    LatexConverter(Passkey, std::string program, char separator)
        : program_(std::move(program)), separator_(separator) {}

    /**
     * @brief Create a converter for files using the given delimiter
     * @param delimiter Field delimiter of the files to convert
     * @param out Receives the converter
     * @param program Program to run instead of csv2latex
     * @return NotSupported if csv2latex has no separator code for the delimiter
     */
    [[nodiscard]] static Status create(char delimiter,
                                       std::unique_ptr<LatexConverter>* out,
                                       std::string program = config::kLatexConverterProgram);

    [[nodiscard]] Status convert(const std::filesystem::path& input,
                                 std::string* output) override;

    /**
     * @brief Argument list passed to the program (without argv[0])
     */
    [[nodiscard]] std::vector<std::string> arguments(const std::filesystem::path& input) const;

    [[nodiscard]] const std::string& program() const noexcept { return program_; }

private:
    std::string program_;
    char separator_;
};

}  // namespace csvcols
