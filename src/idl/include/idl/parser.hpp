#pragma once

#include "ast.hpp"
#include "idl/config.hpp"

#include <expected>
#include <string>
#include <vector>

namespace ctbind::idl::parser
{

/**
 * @brief Declarations of one schema file together with their source positions.
 *
 * The position cache refers into the input buffer passed to parse_file(), which
 * must outlive any lookup through it.
 */
struct ParseResult {
    std::vector<ast::Declaration> declarations;
    position_cache_type position_cache;
};

/**
 * @brief Parse the contents of a schema file.
 *
 * @param input the file contents
 * @param path file name used in error messages
 * @return the parsed declarations, or the formatted parse error
 */
std::expected<ParseResult, std::string> parse_file(const std::string& input, const std::string& path = "");

}  // namespace ctbind::idl::parser
