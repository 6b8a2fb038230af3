#pragma once

#include "ast.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/unused.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace ctbind::idl::parser
{

namespace x3 = boost::spirit::x3;

namespace rule
{

using Skipper = x3::rule<struct SkipperRuleClass, x3::unused_type const>;

// tokens
using Identifier = x3::rule<struct IdentifierRuleClass, std::string>;
using Name = x3::rule<struct NameRuleClass, std::string>;
using StringLiteral = x3::rule<struct StringLiteralRuleClass, std::string>;
using IntegerLiteral = x3::rule<struct IntegerLiteralRuleClass, std::uint64_t>;

// types
using Type = x3::rule<struct TypeRuleClass, model::Type>;
using ScalarType = x3::rule<struct ScalarTypeRuleClass, model::Scalar>;
using ArrayType = x3::rule<struct ArrayTypeRuleClass, model::Array>;
using EventType = x3::rule<struct EventTypeRuleClass, ast::EventSpec>;

// declarations
using AttributeList = x3::rule<struct AttributeListRuleClass, ast::AttributeList>;
using Field = x3::rule<struct FieldRuleClass, ast::Field>;
using EnumItem = x3::rule<struct EnumItemRuleClass, ast::EnumItem>;
using Enum = x3::rule<struct EnumRuleClass, ast::Enum>;
using Layout = x3::rule<struct LayoutRuleClass, model::Layout>;
using Struct = x3::rule<struct StructRuleClass, ast::Struct>;
using Alias = x3::rule<struct AliasRuleClass, ast::Alias>;
using SkipList = x3::rule<struct SkipListRuleClass, std::vector<std::string>>;
using Mapping = x3::rule<struct MappingRuleClass, ast::Mapping>;
using Operation = x3::rule<struct OperationRuleClass, ast::Operation>;
using Declaration = x3::rule<struct DeclarationRuleClass, ast::Declaration>;
using File = x3::rule<struct FileRuleClass, std::vector<ast::Declaration>>;

// grammar hookup
BOOST_SPIRIT_DECLARE(Skipper, Type, File)

}  // namespace rule

rule::Skipper skipper();
rule::Type type();
rule::File file();

}  // namespace ctbind::idl::parser
