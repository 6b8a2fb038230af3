#pragma once

#include "model/operation.hpp"
#include "model/registry.hpp"
#include "model/types.hpp"

#include <string_view>
#include <vector>

/**
 * @file protocol.hpp
 * @brief Native declarations of the client protocol.
 *
 * These types are the same for every domain schema: the client handle, the
 * packet submitted to the native client, its completion status and the
 * operation code. They are compiled into the generator together with their
 * mapping table.
 */
namespace ctbind::model::protocol
{

inline constexpr std::string_view kOperationType = "rpc_operation_t";
inline constexpr std::string_view kPacketStatusType = "rpc_packet_status_t";
inline constexpr std::string_view kPacketType = "rpc_packet_t";
inline constexpr std::string_view kClientType = "rpc_client_t";
inline constexpr std::string_view kStatusType = "rpc_status_t";

/// Liveness operation; never exposed as a wrapper method.
inline constexpr std::string_view kHeartbeatOperation = "pulse";

/// Operation codes used by the client internally, ahead of any domain operation.
std::vector<Variant> internal_operations();

/**
 * @brief Build the protocol declarations.
 *
 * The operation enum is completed with one variant per domain operation,
 * in declaration order.
 */
std::vector<Declaration> declarations(const std::vector<Operation>& operations);

MappingTable mapping_table();

}  // namespace ctbind::model::protocol
