#pragma once

#include "codegen/options.hpp"

#include <expected>
#include <optional>
#include <string>

namespace ctbind
{
/**
 * @brief Command line options
 */
struct Options {
    std::string schema_file;
    std::optional<std::string> config_file;   ///< INI file with generation options
    std::optional<std::string> help_message;  ///< if specified, show help message
    bool check_only = false;                  ///< if true, only parse and validate the schema
    bool print_schema = false;                ///< if true, print the resolved schema model to stdout as JSON
    bool verbose = false;                     ///< if true, enable debug logging
    codegen::GenerationOptions generation;
};

/**
 * @brief Parse command line options
 *
 * Generation options given on the command line take precedence over the ones
 * read from the --config file.
 *
 * @param argc Number of command line arguments
 * @param argv Command line arguments
 * @return Parsed options or error message
 */
std::expected<Options, std::string> parse_command_line(int argc, char* argv[]);

}  // namespace ctbind
