#include "struct_validation_pass.hpp"

#include "semantic_context.hpp"
#include "type_validator.hpp"
#include "utility.hpp"

#include <boost/variant/get.hpp>

namespace ctbind::frontend::semantic
{

namespace
{

void validate_packed(Context& context, const model::StructDecl& s, const std::string& owner)
{
    const auto* mapping = context.registry().lookup(model::Table::Domain, s.name);

    std::uint64_t total = 0;
    bool complete = true;
    for (const auto& field : s.fields) {
        const auto usage = "field '" + field.name + "' of " + owner;

        const auto* scalar = boost::get<model::Scalar>(&context.unalias(field.type));
        if (scalar && (scalar->kind == model::ScalarKind::Signed || scalar->kind == model::ScalarKind::Float)) {
            context.report_error(field.location, "Only bool and unsigned integers can be packed, found '" +
                                                     model::to_string(field.type) + "' in " + usage);
        }

        const auto size = model::bit_size(context.schema(), field.type);
        if (!size) {
            context.report_error(field.location, "Type '" + model::to_string(field.type) + "' of " + usage +
                                                     " has no fixed bit width");
            complete = false;
            continue;
        }
        total += *size;

        // every member that becomes a flag occupies exactly one bit
        if (mapping && *size != 1 && !contains(mapping->skip_fields, field.name)) {
            context.report_error(field.location, "Flag " + usage + " must be a single bit; skip it in the "
                                                 "mapping to use it as padding");
        }
    }

    if (!complete) {
        return;
    }

    if (s.backing) {
        const auto* backing = boost::get<model::Scalar>(&context.unalias(*s.backing));
        if (!backing || backing->kind != model::ScalarKind::Unsigned) {
            context.report_error(s.location, "Backing type '" + model::to_string(*s.backing) + "' of " + owner +
                                                 " must be an unsigned integer");
        } else if (backing->bits != total) {
            context.report_error(s.location, "Fields of " + owner + " occupy " + std::to_string(total) +
                                                 " bits but the backing integer has " +
                                                 std::to_string(backing->bits));
        }
        return;
    }

    if (total != 8 && total != 16 && total != 32 && total != 64 && total != 128) {
        context.report_error(s.location, "Fields of " + owner + " occupy " + std::to_string(total) +
                                             " bits; packed structs must total 8, 16, 32, 64 or 128 bits");
    }
}

}  // namespace

void StructValidationPass::run(Context& context)
{
    TypeValidator type_validator(context);
    for (const auto& declaration : context.program().declarations) {
        const auto* s = boost::get<model::StructDecl>(&declaration);
        if (!s) {
            continue;
        }

        const auto owner = "struct '" + s->name + "'";
        check_unique_names(context, s->fields, owner, "field");

        for (const auto& field : s->fields) {
            type_validator.validate(field.type, field.location, "field '" + field.name + "' of " + owner);
        }

        switch (s->layout) {
            case model::Layout::Extern:
                for (const auto& field : s->fields) {
                    type_validator.validate_layout(field.type, field.location,
                                                   "field '" + field.name + "' of " + owner);
                }
                break;
            case model::Layout::Packed:
                validate_packed(context, *s, owner);
                break;
            case model::Layout::Auto:
                break;
        }

        if (s->backing && s->layout != model::Layout::Packed) {
            context.report_error(s->location, "Only packed structs can declare a backing integer, found one on " +
                                                  owner);
        }
    }
}

}  // namespace ctbind::frontend::semantic
