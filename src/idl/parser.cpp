#include "idl/parser.hpp"

#include "idl/rules.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>

#include <expected>
#include <sstream>

namespace ctbind::idl::parser
{

std::expected<ParseResult, std::string> parse_file(const std::string& input, const std::string& path)
{
    auto iter = input.begin();
    auto end = input.end();

    std::ostringstream diag_stream;

    // the error handler also owns the position cache used by annotate_on_success
    error_handler_type err_handler(iter, end, diag_stream, path);

    // clang-format off
    const auto parser =
        x3::with<x3::error_handler_tag>(std::ref(err_handler))[
            file()
        ];
    // clang-format on

    std::vector<ast::Declaration> declarations;
    bool ok = x3::phrase_parse(iter, end, parser, skipper(), declarations);

    if (!ok || iter != end) {
        auto diagnostic = diag_stream.str();
        if (!diagnostic.empty()) {
            return std::unexpected(diagnostic);
        }
        std::string result = "Parse error near: ";
        auto rem = std::string(iter, end);
        if (rem.size() > 64) {
            rem.resize(64);
        }
        result += rem;
        return std::unexpected(result);
    }

    return ParseResult{
        .declarations = std::move(declarations),
        .position_cache = err_handler.get_position_cache(),
    };
}

}  // namespace ctbind::idl::parser
