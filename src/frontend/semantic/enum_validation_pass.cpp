#include "enum_validation_pass.hpp"

#include "semantic_context.hpp"
#include "type_validator.hpp"
#include "utility.hpp"

#include <boost/variant/get.hpp>

namespace ctbind::frontend::semantic
{

namespace
{

/// Width of an enum tag, or 0 if the tag is not a supported unsigned integer.
unsigned tag_width(const model::Type& tag)
{
    const auto* scalar = boost::get<model::Scalar>(&tag);
    if (!scalar || scalar->kind != model::ScalarKind::Unsigned) {
        return 0;
    }
    switch (scalar->bits) {
        case 8:
        case 16:
        case 32:
        case 64:
        case 128:
            return scalar->bits;
        default:
            return 0;
    }
}

void validate_enum(Context& context, const model::EnumDecl& e)
{
    const auto owner = "enum '" + e.name + "'";

    const auto width = tag_width(context.unalias(e.tag));
    if (width == 0) {
        TypeValidator(context).validate(e.tag, e.location, "tag of " + owner);
        context.report_error(e.location, "Tag type '" + model::to_string(e.tag) + "' of " + owner +
                                             " must be an unsigned integer of 8, 16, 32, 64 or 128 bits");
    }

    check_unique_names(context, e.variants, owner, "enumerator");
    check_unique_values(context, e.variants, owner, "enumerator");

    if (width == 0) {
        return;
    }
    for (const auto& variant : e.variants) {
        if (!fits_unsigned(variant.value, width)) {
            context.report_error(variant.location, "Value " + std::to_string(variant.value) + " of enumerator '" +
                                                       variant.name + "' does not fit the " +
                                                       std::to_string(width) + "-bit tag of " + owner);
        }
    }
}

}  // namespace

void EnumValidationPass::run(Context& context)
{
    for (const auto& declaration : context.program().declarations) {
        if (const auto* e = boost::get<model::EnumDecl>(&declaration)) {
            validate_enum(context, *e);
        }
    }
}

}  // namespace ctbind::frontend::semantic
