#include "idl/config.hpp"
#include "idl/error_handler.hpp"
#include "idl/rules.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/utility/annotate_on_success.hpp>

namespace ctbind::idl::parser::rule
{

// Rule IDs must be complete before the rules are defined and instantiated.
#define DEFINE_ANNOTATED_RULE(rule_name) \
    struct rule_name##RuleClass : ExpectationErrorHandler, x3::annotate_on_success {}

DEFINE_ANNOTATED_RULE(Enum);
DEFINE_ANNOTATED_RULE(Struct);
DEFINE_ANNOTATED_RULE(Alias);
DEFINE_ANNOTATED_RULE(Mapping);
DEFINE_ANNOTATED_RULE(Operation);

#undef DEFINE_ANNOTATED_RULE

struct FieldRuleClass : x3::annotate_on_success {};
struct EnumItemRuleClass : x3::annotate_on_success {};

}  // namespace ctbind::idl::parser::rule

#include "idl/rules_definition.hpp"

namespace ctbind::idl::parser::rule
{

BOOST_SPIRIT_INSTANTIATE(Skipper, iterator_type, boost::spirit::x3::unused_type);
BOOST_SPIRIT_INSTANTIATE(Type, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(File, iterator_type, context_type);

}  // namespace ctbind::idl::parser::rule
