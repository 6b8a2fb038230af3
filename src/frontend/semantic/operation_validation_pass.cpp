#include "operation_validation_pass.hpp"

#include "model/protocol.hpp"
#include "semantic_context.hpp"
#include "type_validator.hpp"
#include "utility.hpp"

#include <boost/variant/get.hpp>

namespace ctbind::frontend::semantic
{

namespace
{

constexpr unsigned kOperationCodeBits = 8;

/// Events and results cross the boundary as arrays of FFI values.
void check_payload(Context& context, const model::Operation& operation, const model::Type& type,
                   const std::string& role)
{
    const auto usage = role + " of operation '" + operation.name + "'";
    const auto& resolved = context.unalias(type);

    if (const auto* scalar = boost::get<model::Scalar>(&resolved)) {
        const bool supported = scalar->kind == model::ScalarKind::Bool ||
                               (scalar->kind == model::ScalarKind::Unsigned &&
                                (scalar->bits == 8 || scalar->bits == 16 || scalar->bits == 32 ||
                                 scalar->bits == 64 || scalar->bits == 128));
        if (!supported) {
            context.report_error(operation.location,
                                 "Type '" + model::to_string(type) + "' cannot be used as " + usage);
        }
        return;
    }

    if (const auto* named = boost::get<model::Named>(&resolved)) {
        if (context.schema().find(named->name) && !context.registry().lookup(model::Table::Domain, named->name)) {
            context.report_error(operation.location,
                                 "Type '" + named->name + "' used as " + usage + " is not mapped in the domain table");
        }
        return;
    }

    context.report_error(operation.location, "Type '" + model::to_string(type) + "' cannot be used as " + usage);
}

}  // namespace

void OperationValidationPass::run(Context& context)
{
    const auto& operations = context.program().operations;
    check_unique_names(context, operations, "schema", "operation");
    check_unique_values(context, operations, "schema", "operation");

    const auto internal = model::protocol::internal_operations();
    TypeValidator type_validator(context);

    for (const auto& operation : operations) {
        for (const auto& reserved : internal) {
            if (operation.name == reserved.name) {
                context.report_error(operation.location,
                                     "Operation name '" + operation.name + "' is reserved for internal use");
            }
            if (operation.value == reserved.value) {
                context.report_error(operation.location, "Operation '" + operation.name + "' uses value " +
                                                             std::to_string(operation.value) +
                                                             " of internal operation '" + reserved.name + "'");
            }
        }

        if (!fits_unsigned(operation.value, kOperationCodeBits)) {
            context.report_error(operation.location, "Value " + std::to_string(operation.value) + " of operation '" +
                                                         operation.name + "' does not fit the 8-bit operation code");
        }

        type_validator.validate(operation.event, operation.location, "event of operation '" + operation.name + "'");
        type_validator.validate(operation.result, operation.location,
                                "result of operation '" + operation.name + "'");

        // the heartbeat carries no payload and gets no wrapper method
        if (operation.name == model::protocol::kHeartbeatOperation) {
            continue;
        }
        check_payload(context, operation, operation.event, "event");
        check_payload(context, operation, operation.result, "result");
    }
}

}  // namespace ctbind::frontend::semantic
