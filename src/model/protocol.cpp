#include "model/protocol.hpp"

#include <initializer_list>
#include <string>
#include <utility>

namespace ctbind::model::protocol
{
namespace
{

std::vector<Variant> variants(std::initializer_list<std::pair<const char*, std::uint64_t>> items)
{
    std::vector<Variant> out;
    out.reserve(items.size());
    for (const auto& [name, value] : items) {
        out.push_back(Variant{name, value, {}});
    }
    return out;
}

Field field(const char* name, Type type, bool reserved = false)
{
    return Field{name, std::move(type), reserved, {}};
}

EnumDecl operation_enum(const std::vector<Operation>& operations)
{
    EnumDecl decl;
    decl.name = std::string(kOperationType);
    decl.tag = unsigned_type(8);
    decl.variants = internal_operations();
    for (const auto& operation : operations) {
        decl.variants.push_back(Variant{operation.name, operation.value, operation.location});
    }
    return decl;
}

EnumDecl packet_status_enum()
{
    EnumDecl decl;
    decl.name = std::string(kPacketStatusType);
    decl.tag = unsigned_type(8);
    decl.variants = variants({
        {"ok", 0},
        {"too_much_data", 1},
        {"client_evicted", 2},
        {"client_release_too_low", 3},
        {"client_release_too_high", 4},
        {"client_shutdown", 5},
        {"invalid_operation", 6},
        {"invalid_data_size", 7},
    });
    return decl;
}

StructDecl packet_struct()
{
    const auto packet_ptr = optional_of(pointer_to(named(std::string(kPacketType))));
    const auto data_ptr = optional_of(pointer_to(opaque_type()));

    StructDecl decl;
    decl.name = std::string(kPacketType);
    decl.layout = Layout::Extern;
    decl.fields = {
        field("next", packet_ptr),
        field("user_data", data_ptr),
        field("operation", unsigned_type(8)),
        field("status", named(std::string(kPacketStatusType))),
        field("data_size", unsigned_type(32)),
        field("data", data_ptr),
        field("batch_next", packet_ptr),
        field("batch_tail", packet_ptr),
        field("batch_size", unsigned_type(32)),
        field("batch_allowed", bool_type()),
        field("reserved", array_of(unsigned_type(8), 7), true),
    };
    return decl;
}

AliasDecl client_alias()
{
    return AliasDecl{std::string(kClientType), pointer_to(opaque_type()), {}};
}

EnumDecl status_enum()
{
    EnumDecl decl;
    decl.name = std::string(kStatusType);
    decl.tag = unsigned_type(32);
    decl.variants = variants({
        {"success", 0},
        {"unexpected", 1},
        {"out_of_memory", 2},
        {"address_invalid", 3},
        {"address_limit_exceeded", 4},
        {"system_resources", 5},
        {"network_subsystem", 6},
    });
    return decl;
}

}  // namespace

std::vector<Variant> internal_operations()
{
    return variants({
        {"reserved", 0},
        {"root", 1},
        {"register", 2},
    });
}

std::vector<Declaration> declarations(const std::vector<Operation>& operations)
{
    std::vector<Declaration> out;
    out.emplace_back(operation_enum(operations));
    out.emplace_back(packet_status_enum());
    out.emplace_back(packet_struct());
    out.emplace_back(client_alias());
    out.emplace_back(status_enum());
    return out;
}

MappingTable mapping_table()
{
    return {
        MappingEntry{std::string(kOperationType), "Operation", {"reserved", "root", "register"}, {}},
        MappingEntry{std::string(kPacketStatusType), "PacketStatus", {}, {}},
        MappingEntry{std::string(kPacketType), "Packet", {}, {}},
        MappingEntry{std::string(kClientType), "Client", {}, {}},
        MappingEntry{std::string(kStatusType), "Status", {}, {}},
    };
}

}  // namespace ctbind::model::protocol
