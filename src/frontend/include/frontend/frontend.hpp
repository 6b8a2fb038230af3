#pragma once

#include "frontend/program.hpp"

#include <expected>
#include <string>

namespace ctbind::frontend
{

/**
 * @brief Parse a program from a schema file.
 *
 * @param path Path to the schema file.
 * @return std::expected<Program, std::string> Parsed program or error message.
 */
std::expected<Program, std::string> parse_program(const std::string& path);

namespace detail
{

/**
 * @brief Read a file into a string.
 *
 * @param path Path to the file.
 * @return File content or error message.
 */
std::expected<std::string, std::string> read_file(const std::string& path);

/**
 * @brief Parse schema text and convert it to the program model.
 *
 * @param content Schema text.
 * @param path File name recorded in source locations and error messages.
 * @return Parsed program or error message.
 */
std::expected<Program, std::string> parse_file_content(const std::string& content, const std::string& path);

}  // namespace detail

}  // namespace ctbind::frontend
