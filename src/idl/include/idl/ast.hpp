#pragma once

#include "model/operation.hpp"
#include "model/types.hpp"

#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/optional.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>
#include <boost/variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file ast.hpp
 * @brief Parse tree of a schema description file.
 *
 * Type expressions are parsed straight into model::Type; declarations keep
 * their source position so diagnostics can point at them.
 */
namespace ctbind::idl::ast
{

struct PositionTaggedNode : boost::spirit::x3::position_tagged {
};

using AttributeList = std::vector<std::string>;

// ---------- declarations ----------

struct Field : PositionTaggedNode {
    std::string name;
    model::Type type;
    AttributeList attrs;  // e.g. [reserved]
};

struct EnumItem : PositionTaggedNode {
    std::string name;
    boost::optional<std::uint64_t> value;  // implicit: previous + 1
};

struct Enum : PositionTaggedNode {
    std::string name;
    model::Type tag;
    std::vector<EnumItem> items;
};

struct Struct : PositionTaggedNode {
    model::Layout layout = model::Layout::Auto;
    std::string name;
    boost::optional<model::Type> backing;
    std::vector<Field> fields;
};

struct Alias : PositionTaggedNode {
    std::string name;
    model::Type target;
};

struct Mapping : PositionTaggedNode {
    std::string native_name;
    std::string target_name;
    std::vector<std::string> skip_fields;
};

struct EventSpec {
    model::Arity arity = model::Arity::Single;
    model::Type type;
};

struct Operation : PositionTaggedNode {
    std::string name;
    std::uint64_t value = 0;
    std::string event_name;
    EventSpec event;
    model::Type result;
};

// clang-format off
using Declaration = boost::variant<
    Enum,
    Struct,
    Alias,
    Mapping,
    Operation
>;
// clang-format on

}  // namespace ctbind::idl::ast

BOOST_FUSION_ADAPT_STRUCT(ctbind::model::Array, element, length)
BOOST_FUSION_ADAPT_STRUCT(ctbind::idl::ast::Field, name, type, attrs)
BOOST_FUSION_ADAPT_STRUCT(ctbind::idl::ast::EnumItem, name, value)
BOOST_FUSION_ADAPT_STRUCT(ctbind::idl::ast::Enum, name, tag, items)
BOOST_FUSION_ADAPT_STRUCT(ctbind::idl::ast::Struct, layout, name, backing, fields)
BOOST_FUSION_ADAPT_STRUCT(ctbind::idl::ast::Alias, name, target)
BOOST_FUSION_ADAPT_STRUCT(ctbind::idl::ast::Mapping, native_name, target_name, skip_fields)
BOOST_FUSION_ADAPT_STRUCT(ctbind::idl::ast::EventSpec, arity, type)
BOOST_FUSION_ADAPT_STRUCT(ctbind::idl::ast::Operation, name, value, event_name, event, result)
