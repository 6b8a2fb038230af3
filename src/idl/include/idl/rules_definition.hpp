#pragma once

#include "idl/ast.hpp"
#include "rules.hpp"

#include <utility>

/**
 * @file rules_definition.hpp
 * @brief Spirit rules definitions
 *
 * This file contains Spirit rules definitions for the schema description parser.
 *
 * @note This file is included in exactly one module, hence the NOLINT.
 *
 */
// NOLINTBEGIN(misc-definitions-in-headers)

namespace ctbind::idl::parser
{

namespace rule
{

namespace x3 = boost::spirit::x3;

// -------------- helpers --------------
inline auto make_kw(const char* s)
{
    return x3::lexeme[x3::lit(s) >> !(x3::alnum | x3::char_('_'))];
}

inline auto make_scalar(model::ScalarKind kind)
{
    return [kind](auto& ctx) { _val(ctx) = model::Scalar{kind, _attr(ctx)}; };
}

// clang-format off
// ... to make the rules more readable

const auto kw_enum      = make_kw("enum");
const auto kw_struct    = make_kw("struct");
const auto kw_extern    = make_kw("extern");
const auto kw_packed    = make_kw("packed");
const auto kw_alias     = make_kw("alias");
const auto kw_map       = make_kw("map");
const auto kw_skip      = make_kw("skip");
const auto kw_operation = make_kw("operation");
const auto kw_batch     = make_kw("batch");

// type constructors
const auto kw_bool     = make_kw("bool");
const auto kw_opaque   = make_kw("opaque");
const auto kw_void     = make_kw("void");
const auto kw_array    = make_kw("array");
const auto kw_ptr      = make_kw("ptr");
const auto kw_optional = make_kw("optional");
const auto kw_slice    = make_kw("slice");

// Words that can never name a declaration referenced from a type expression.
x3::symbols<> reserved_identifiers;
struct reserved_init {
  reserved_init() {
    reserved_identifiers.add
      ("enum")
      ("struct")
      ("extern")
      ("packed")
      ("alias")
      ("map")
      ("skip")
      ("operation")
      ("batch")
      ("bool")
      ("opaque")
      ("void")
      ("array")
      ("ptr")
      ("optional")
      ("slice");
  }
} reserved_init_instance;

// skipper
Skipper skipper = "skipper";

const auto line_comment = x3::lexeme["//" >> *(x3::char_ - x3::eol) >> (x3::eol | x3::eoi)];
const auto block_comment = x3::lexeme["/*" >> *(x3::char_ - "*/") >> "*/"];
const auto skipper_def = line_comment | block_comment | x3::space;

// tokens
Identifier identifier = "identifier";
Name name = "type name";
StringLiteral string_lit = "string";
IntegerLiteral uint_lit = "integer";

const auto identifier_def =
    x3::lexeme[
        (x3::alpha | x3::char_('_'))
        >> *(x3::alnum | x3::char_('_'))
    ];

const auto name_def =
    x3::lexeme[ !(reserved_identifiers >> !(x3::alnum | x3::char_('_')))
        >> (x3::alpha | x3::char_('_'))
        >> *(x3::alnum | x3::char_('_'))
    ];

// strings: capture raw range with quotes, then strip quotes; keep escapes as-is
const auto string_lit_def =
    x3::raw[x3::lexeme['"' >> *('\\' >> x3::char_ | ~x3::char_('"')) >> '"']]
    [([](auto& ctx){
        auto const& rng = _attr(ctx);           // iterator_range<It>
        _val(ctx) = std::string(rng.begin() + 1, rng.end() - 1);
    })];

// integers: hex 0x..., binary 0b..., decimal
const auto uint_lit_def =
    x3::lexeme[
          ("0x" >> x3::uint_parser<std::uint64_t, 16>{})
        | ("0b" >> x3::uint_parser<std::uint64_t, 2>{})
        | x3::uint_parser<std::uint64_t, 10>{}
    ];

// -------------- type rules --------------
Type type = "type";
ScalarType scalar_type = "scalar type";
ArrayType array_type = "array type";
EventType event_type = "event type";

const auto bit_width = x3::uint_parser<unsigned, 10>{} >> !(x3::alnum | x3::char_('_'));

const auto scalar_type_def =
      kw_bool[([](auto& ctx){ _val(ctx) = model::Scalar{model::ScalarKind::Bool, 1}; })]
    | x3::lexeme['u' >> bit_width][make_scalar(model::ScalarKind::Unsigned)]
    | x3::lexeme['i' >> bit_width][make_scalar(model::ScalarKind::Signed)]
    | x3::lexeme['f' >> bit_width][make_scalar(model::ScalarKind::Float)];

// array<T, N>: attribute is the Fusion sequence (Type, uint64)
const auto array_type_def = kw_array > '<' > type > ',' > uint_lit > '>';

const auto assign = [](auto& ctx) { _val(ctx) = std::move(_attr(ctx)); };

const auto type_def =
      scalar_type[assign]
    | kw_opaque[([](auto& ctx){ _val(ctx) = model::Opaque{}; })]
    | kw_void[([](auto& ctx){ _val(ctx) = model::Void{}; })]
    | array_type[assign]
    | (kw_ptr > '<' > type > '>')[([](auto& ctx){ _val(ctx) = model::Pointer{std::move(_attr(ctx))}; })]
    | (kw_optional > '<' > type > '>')[([](auto& ctx){ _val(ctx) = model::Optional{std::move(_attr(ctx))}; })]
    | (kw_slice > '<' > type > '>')[([](auto& ctx){ _val(ctx) = model::Slice{std::move(_attr(ctx))}; })]
    | name[([](auto& ctx){ _val(ctx) = model::Named{std::move(_attr(ctx))}; })];

const auto event_type_def =
      (kw_batch > '<' > type > '>')
        [([](auto& ctx){ _val(ctx) = ast::EventSpec{model::Arity::Batch, std::move(_attr(ctx))}; })]
    | type
        [([](auto& ctx){ _val(ctx) = ast::EventSpec{model::Arity::Single, std::move(_attr(ctx))}; })];

// -------------- declarations --------------
AttributeList attribute_list = "attribute list";
Field field = "field";
EnumItem enum_item = "enum item";
Enum enum_decl = "enum";
Layout layout = "layout";
Struct struct_decl = "struct";
Alias alias_decl = "alias";
SkipList skip_list = "skip list";
Mapping map_decl = "map";
Operation operation_decl = "operation";
Declaration decl = "declaration";
File file = "file";

const auto attribute_list_def = '[' > (identifier % ',') > ']';

const auto attribute_list_or_empty = attribute_list | x3::attr(ast::AttributeList{});

const auto field_def = identifier >> ':' > type > attribute_list_or_empty > ';';

const auto enum_item_def = identifier >> -('=' > uint_lit);

const auto enum_decl_def =
    kw_enum > identifier > ':' > type
    > '{' > (enum_item % ',') > -x3::lit(',') > '}' > -x3::lit(';');

const auto layout_def =
      (kw_extern >> x3::attr(model::Layout::Extern))
    | (kw_packed >> x3::attr(model::Layout::Packed))
    | x3::attr(model::Layout::Auto);

const auto struct_decl_def =
    layout >> kw_struct > identifier > -(':' > type)
    > '{' > *field > '}' > -x3::lit(';');

const auto alias_decl_def = kw_alias > identifier > '=' > type > ';';

const auto skip_list_def = kw_skip > '(' > (identifier % ',') > ')';

const auto skip_list_or_empty = skip_list | x3::attr(std::vector<std::string>{});

const auto map_decl_def = kw_map > identifier > '=' > string_lit > skip_list_or_empty > ';';

const auto operation_decl_def =
    kw_operation > identifier > '=' > uint_lit
    > '(' > identifier > ':' > event_type > ')'
    > "->" > type > ';';

const auto decl_def =
      enum_decl
    | struct_decl
    | alias_decl
    | map_decl
    | operation_decl;

const auto file_def = *decl;

// clang-format on

// clang-format off
BOOST_SPIRIT_DEFINE(
    skipper,
    identifier,
    name,
    string_lit,
    uint_lit,
    scalar_type,
    array_type,
    type,
    event_type,
    attribute_list,
    field,
    enum_item,
    enum_decl,
    layout,
    struct_decl,
    alias_decl,
    skip_list,
    map_decl,
    operation_decl,
    decl,
    file
);
// clang-format on

}  // namespace rule

rule::Skipper skipper()
{
    return rule::skipper;
}

rule::Type type()
{
    return rule::type;
}

rule::File file()
{
    return rule::file;
}

}  // namespace ctbind::idl::parser

// NOLINTEND(misc-definitions-in-headers)
