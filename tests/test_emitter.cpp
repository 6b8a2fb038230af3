#include <gtest/gtest.h>

#include "codegen/options.hpp"
#include "emitter.hpp"
#include "model/protocol.hpp"

#include <sstream>

using namespace ctbind;
using namespace ctbind::model;

namespace
{

Field field(std::string name, Type type, bool reserved = false)
{
    return Field{std::move(name), std::move(type), reserved, {}};
}

class EmitterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        operations = {
            Operation{"pulse", 128, "event", Arity::Single, void_type(), void_type(), {}},
            Operation{"create_transfers", 139, "transfers", Arity::Batch, named("Transfer"), named("Result"), {}},
            Operation{"lookup", 141, "id", Arity::Single, unsigned_type(128), named("Transfer"), {}},
        };

        for (auto& declaration : protocol::declarations(operations)) {
            schema.add(std::move(declaration));
        }

        StructDecl flags;
        flags.name = "TransferFlags";
        flags.layout = Layout::Packed;
        flags.fields = {field("linked", bool_type()), field("padding", unsigned_type(13)),
                        field("pending", bool_type()), field("closed", bool_type())};
        schema.add(flags);

        StructDecl transfer;
        transfer.name = "Transfer";
        transfer.layout = Layout::Extern;
        transfer.fields = {
            field("id", named("Uint128")),
            field("reserved", unsigned_type(32), true),
            field("flags", named("TransferFlags")),
            field("ok", bool_type()),
            field("pad", array_of(unsigned_type(8), 4)),
            field("when", named("Timestamp")),
            field("result", named("Result")),
        };
        schema.add(transfer);

        schema.add(EnumDecl{"Result",
                            unsigned_type(32),
                            {{"ok", 0, {}}, {"reserved_flag", 4, {}}, {"failed", 5, {}}},
                            {}});
        schema.add(AliasDecl{"Timestamp", unsigned_type(64), {}});
        schema.add(AliasDecl{"Uint128", unsigned_type(128), {}});
        schema.add(StructDecl{"Local", Layout::Auto, std::nullopt, {field("a", unsigned_type(8))}, {}});

        registry = Registry{protocol::mapping_table(),
                            {
                                MappingEntry{"TransferFlags", "TransferFlags", {"padding"}, {}},
                                MappingEntry{"Transfer", "Transfer", {}, {}},
                                MappingEntry{"Result", "CreateResult", {"reserved_flag"}, {}},
                                MappingEntry{"Timestamp", "Timestamp", {}, {}},
                            }};
    }

    const MappingEntry& entry(std::string_view native_name) const
    {
        const auto* found = registry.lookup(native_name);
        EXPECT_NE(found, nullptr) << native_name;
        return *found;
    }

    Schema schema;
    Registry registry;
    codegen::GenerationOptions options;
    std::vector<Operation> operations;
};

}  // namespace

TEST(EmitterHelpers, ToUpper)
{
    EXPECT_EQ(codegen::to_upper("create_accounts"), "CREATE_ACCOUNTS");
    EXPECT_EQ(codegen::to_upper("user_data_128"), "USER_DATA_128");
    EXPECT_EQ(codegen::to_upper("Already"), "ALREADY");
}

TEST_F(EmitterTest, Preamble)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    emitter.emit_preamble(out);

    // clang-format off
    const std::string expectation =
        "############################################\n"
        "## This file was auto-generated by ctbind ##\n"
        "##        Do not manually modify.         ##\n"
        "############################################\n"
        "from __future__ import annotations\n"
        "\n"
        "import ctypes\n"
        "import enum\n"
        "from collections.abc import Callable # noqa: TCH003\n"
        "from typing import Any\n"
        "\n"
        "from .lib import c_uint128, dataclass, rpclib, validate_uint\n"
        "\n"
        "\n";
    // clang-format on
    EXPECT_EQ(out.str(), expectation);
}

TEST_F(EmitterTest, PreambleUsesConfiguredNames)
{
    options.generator_name = "ledger_bindings";
    options.runtime_module = "ledger.runtime";
    options.library_handle = "ledger_lib";
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    emitter.emit_preamble(out);

    const auto text = out.str();
    EXPECT_NE(text.find("## This file was auto-generated by ledger_bindings ##\n"), std::string::npos) << text;
    EXPECT_NE(text.find("from ledger.runtime import c_uint128, dataclass, ledger_lib, validate_uint\n"),
              std::string::npos)
        << text;
}

TEST_F(EmitterTest, EnumSkipsMembers)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_declaration(out, entry("Result")));

    EXPECT_EQ(out.str(),
              "class CreateResult(enum.IntEnum):\n"
              "    OK = 0\n"
              "    FAILED = 5\n"
              "\n\n");
}

TEST_F(EmitterTest, OperationEnumHidesInternalOperations)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_declaration(out, entry(protocol::kOperationType)));

    EXPECT_EQ(out.str(),
              "class Operation(enum.IntEnum):\n"
              "    PULSE = 128\n"
              "    CREATE_TRANSFERS = 139\n"
              "    LOOKUP = 141\n"
              "\n\n");
}

TEST_F(EmitterTest, FlagsKeepDeclarationIndex)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_declaration(out, entry("TransferFlags")));

    EXPECT_EQ(out.str(),
              "class TransferFlags(enum.IntFlag):\n"
              "    NONE = 0\n"
              "    LINKED = 1 << 0\n"
              "    PENDING = 1 << 2\n"
              "    CLOSED = 1 << 3\n"
              "\n\n");
}

TEST_F(EmitterTest, FlagsWithSkippedReservedBits)
{
    StructDecl flags;
    flags.name = "Flags";
    flags.layout = Layout::Packed;
    flags.fields = {field("linked", bool_type()), field("pending", bool_type()),
                    field("reserved", unsigned_type(14), true)};
    schema.add(flags);

    MappingEntry mapping{"Flags", "Flags", {"reserved"}, {}};
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_declaration(out, mapping));

    EXPECT_EQ(out.str(),
              "class Flags(enum.IntFlag):\n"
              "    NONE = 0\n"
              "    LINKED = 1 << 0\n"
              "    PENDING = 1 << 1\n"
              "\n\n");
}

TEST_F(EmitterTest, FlagBitsDoNotDependOnSkipList)
{
    codegen::Emitter emitter{schema, registry, options};

    std::ostringstream all_visible;
    ASSERT_TRUE(emitter.emit_declaration(all_visible, MappingEntry{"TransferFlags", "TransferFlags", {}, {}}));
    std::ostringstream linked_hidden;
    ASSERT_TRUE(emitter.emit_declaration(linked_hidden,
                                         MappingEntry{"TransferFlags", "TransferFlags", {"linked", "padding"}, {}}));

    for (const auto* member : {"    PENDING = 1 << 2\n", "    CLOSED = 1 << 3\n"}) {
        EXPECT_NE(all_visible.str().find(member), std::string::npos) << all_visible.str();
        EXPECT_NE(linked_hidden.str().find(member), std::string::npos) << linked_hidden.str();
    }
    EXPECT_NE(all_visible.str().find("    PADDING = 1 << 1\n"), std::string::npos) << all_visible.str();
    EXPECT_EQ(linked_hidden.str().find("LINKED"), std::string::npos) << linked_hidden.str();
    EXPECT_NE(linked_hidden.str().find("    NONE = 0\n"), std::string::npos) << linked_hidden.str();
}

TEST_F(EmitterTest, AliasAndExternDeclarations)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_declaration(out, entry("Timestamp")));
    ASSERT_TRUE(emitter.emit_declaration(out, entry(protocol::kClientType)));
    ASSERT_TRUE(emitter.emit_declaration(out, entry("Transfer")));

    EXPECT_EQ(out.str(),
              "Timestamp = ctypes.c_uint64\n"
              "\n"
              "Client = ctypes.c_void_p\n"
              "\n");
}

TEST_F(EmitterTest, AutoLayoutStructCannotBeEmitted)
{
    MappingEntry local{"Local", "Local", {}, {}};
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;

    auto emitted = emitter.emit_declaration(out, local);
    ASSERT_FALSE(emitted);
    EXPECT_NE(emitted.error().find("Invalid C struct type 'Local'"), std::string::npos);
}

TEST_F(EmitterTest, UndeclaredMappingFails)
{
    MappingEntry missing{"Missing", "Missing", {}, {}};
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;

    auto emitted = emitter.emit_declaration(out, missing);
    ASSERT_FALSE(emitted);
    EXPECT_EQ(emitted.error(), "Mapped type 'Missing' is not declared");
}

TEST_F(EmitterTest, Dataclass)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_dataclass(out, entry("Transfer")));

    EXPECT_EQ(out.str(),
              "@dataclass\n"
              "class Transfer:\n"
              "    id: int = 0\n"
              "    flags: TransferFlags = TransferFlags.NONE\n"
              "    ok: bool = False\n"
              "    pad: int[4] = (0,) * 4\n"
              "    when: int = 0\n"
              "    result: CreateResult = 0\n"
              "\n\n");
}

TEST_F(EmitterTest, DataclassIgnoresNonStructs)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_dataclass(out, entry("Result")));
    ASSERT_TRUE(emitter.emit_dataclass(out, entry("TransferFlags")));
    EXPECT_TRUE(out.str().empty());
}

TEST_F(EmitterTest, StructureWithConversion)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_structure(out, entry("Transfer"), true));

    // clang-format off
    const std::string expectation =
        "class CTransfer(ctypes.Structure):\n"
        "    @classmethod\n"
        "    def from_param(cls, obj):\n"
        "        for v in obj.pad:\n"
        "            validate_uint(bits=8, name=\"pad\", number=v)\n"
        "        validate_uint(bits=64, name=\"when\", number=obj.when)\n"
        "        return cls(\n"
        "            id=c_uint128.from_param(obj.id),\n"
        "            flags=obj.flags,\n"
        "            ok=obj.ok,\n"
        "            pad=obj.pad,\n"
        "            when=obj.when,\n"
        "            result=obj.result,\n"
        "        )\n"
        "\n"
        "\n"
        "    def to_python(self):\n"
        "        return Transfer(\n"
        "            id=self.id.to_python(),\n"
        "            flags=TransferFlags(self.flags),\n"
        "            ok=self.ok,\n"
        "            pad=tuple(self.pad),\n"
        "            when=self.when,\n"
        "            result=CreateResult(self.result),\n"
        "        )\n"
        "\n"
        "CTransfer._fields_ = [ # noqa: SLF001\n"
        "    (\"id\", c_uint128),\n"
        "    (\"reserved\", ctypes.c_uint32),\n"
        "    (\"flags\", ctypes.c_uint16),\n"
        "    (\"ok\", ctypes.c_bool),\n"
        "    (\"pad\", ctypes.c_uint8 * 4),\n"
        "    (\"when\", ctypes.c_uint64),\n"
        "    (\"result\", ctypes.c_uint32),\n"
        "]\n"
        "\n"
        "\n";
    // clang-format on
    EXPECT_EQ(out.str(), expectation);
}

TEST_F(EmitterTest, StructureConvertsArrayElements)
{
    StructDecl record;
    record.name = "Record";
    record.layout = Layout::Extern;
    record.fields = {
        field("ids", array_of(named("Uint128"), 2)),
        field("results", array_of(named("Result"), 3)),
        field("grid", array_of(array_of(unsigned_type(16), 2), 3)),
        field("mask", array_of(bool_type(), 8)),
    };
    schema.add(record);

    MappingEntry mapping{"Record", "Record", {}, {}};
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_structure(out, mapping, true));

    const auto text = out.str();
    // element ranges are checked before construction
    EXPECT_NE(text.find("        for v in obj.grid:\n"
                        "            for v1 in v:\n"
                        "                validate_uint(bits=16, name=\"grid\", number=v1)\n"
                        "        return cls(\n"),
              std::string::npos)
        << text;
    EXPECT_EQ(text.find("name=\"results\""), std::string::npos) << text;
    EXPECT_EQ(text.find("name=\"mask\""), std::string::npos) << text;

    EXPECT_NE(text.find("            ids=tuple(c_uint128.from_param(v) for v in obj.ids),\n"), std::string::npos)
        << text;
    EXPECT_NE(text.find("            grid=obj.grid,\n"), std::string::npos) << text;

    EXPECT_NE(text.find("            ids=tuple(v.to_python() for v in self.ids),\n"), std::string::npos) << text;
    EXPECT_NE(text.find("            results=tuple(CreateResult(v) for v in self.results),\n"), std::string::npos)
        << text;
    EXPECT_NE(text.find("            grid=tuple(tuple(v) for v in self.grid),\n"), std::string::npos) << text;
    EXPECT_NE(text.find("            mask=tuple(self.mask),\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    (\"grid\", ctypes.c_uint16 * 2 * 3),\n"), std::string::npos) << text;
}

TEST_F(EmitterTest, ProtocolStructureHasNoConversion)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_structure(out, entry(protocol::kPacketType), false));

    const auto text = out.str();
    EXPECT_EQ(text.find("to_python"), std::string::npos) << text;
    EXPECT_NE(text.find("        validate_uint(bits=8, name=\"operation\", number=obj.operation)\n"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("    (\"next\", ctypes.POINTER(CPacket)),\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    (\"user_data\", ctypes.c_void_p),\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    (\"status\", ctypes.c_uint8),\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    (\"reserved\", ctypes.c_uint8 * 7),\n"), std::string::npos) << text;
    EXPECT_EQ(text.find("reserved=obj.reserved"), std::string::npos) << text;
}

TEST_F(EmitterTest, StructureWithUnloweredFieldFails)
{
    StructDecl bad;
    bad.name = "Bad";
    bad.layout = Layout::Extern;
    bad.fields = {field("value", signed_type(32))};
    schema.add(bad);

    MappingEntry mapping{"Bad", "Bad", {}, {}};
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;

    auto emitted = emitter.emit_structure(out, mapping, false);
    ASSERT_FALSE(emitted);
    EXPECT_NE(emitted.error().find("Field 'value' of struct 'Bad'"), std::string::npos) << emitted.error();
}

TEST_F(EmitterTest, Lifecycle)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_lifecycle(out));

    const auto text = out.str();
    const std::string callback =
        "OnCompletion = ctypes.CFUNCTYPE(None, ctypes.c_void_p, Client, ctypes.POINTER(CPacket),\n" +
        std::string(32, ' ') + "ctypes.c_uint64, ctypes.c_void_p, ctypes.c_uint32)\n";
    EXPECT_NE(text.find(callback), std::string::npos) << text;

    const std::string init =
        "rpc_client_init = rpclib.rpc_client_init\n"
        "rpc_client_init.restype = Status\n"
        "rpc_client_init.argtypes = [ctypes.POINTER(Client), c_uint128, ctypes.c_char_p,\n" +
        std::string(28, ' ') + "ctypes.c_uint32, ctypes.c_void_p, OnCompletion]\n";
    EXPECT_NE(text.find(init), std::string::npos) << text;

    EXPECT_NE(text.find("rpc_client_init_echo.argtypes = [ctypes.POINTER(Client), c_uint128, ctypes.c_char_p,\n"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("rpc_client_deinit.restype = None\nrpc_client_deinit.argtypes = [Client]\n"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("rpc_client_submit = rpclib.rpc_client_submit\n"), std::string::npos) << text;
    EXPECT_NE(text.find("rpc_client_submit.argtypes = [Client, ctypes.POINTER(CPacket)]\n"), std::string::npos)
        << text;
}

TEST_F(EmitterTest, LifecycleUsesFunctionPrefix)
{
    options.function_prefix = "tb_client";
    options.library_handle = "tbclient";
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_lifecycle(out));

    const auto text = out.str();
    EXPECT_NE(text.find("tb_client_deinit = tbclient.tb_client_deinit\n"), std::string::npos) << text;
    EXPECT_EQ(text.find("rpc_client"), std::string::npos) << text;
}

TEST_F(EmitterTest, BlockingMethodSet)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_method_set(out, operations, codegen::CallingConvention::Blocking));

    // clang-format off
    const std::string expectation =
        "class StateMachineMixin:\n"
        "    _submit: Callable[[Operation, Any, Any, Any], Any]\n"
        "    def create_transfers(self, transfers: list[Transfer]) -> list[CreateResult]:\n"
        "        return self._submit(\n"
        "            Operation.CREATE_TRANSFERS,\n"
        "            transfers,\n"
        "            CTransfer,\n"
        "            ctypes.c_uint32,\n"
        "        )\n"
        "\n"
        "    def lookup(self, id: int) -> list[Transfer]:\n"
        "        return self._submit(\n"
        "            Operation.LOOKUP,\n"
        "            [id],\n"
        "            c_uint128,\n"
        "            CTransfer,\n"
        "        )\n"
        "\n"
        "\n"
        "\n";
    // clang-format on
    EXPECT_EQ(out.str(), expectation);
}

TEST_F(EmitterTest, AwaitableMethodSet)
{
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;
    ASSERT_TRUE(emitter.emit_method_set(out, operations, codegen::CallingConvention::Awaitable));

    const auto text = out.str();
    EXPECT_TRUE(text.starts_with("class AsyncStateMachineMixin:\n")) << text;
    EXPECT_NE(text.find("    async def create_transfers(self, transfers: list[Transfer]) -> list[CreateResult]:\n"
                        "        return await self._submit(\n"),
              std::string::npos)
        << text;
    EXPECT_NE(text.find("    async def lookup(self, id: int) -> list[Transfer]:\n"), std::string::npos) << text;
    EXPECT_EQ(text.find("pulse"), std::string::npos) << text;
}

TEST_F(EmitterTest, MethodWithUnmappedPayloadFails)
{
    std::vector<Operation> broken{
        Operation{"inspect", 150, "packet", Arity::Single, named(std::string(protocol::kPacketType)), bool_type(), {}},
    };
    codegen::Emitter emitter{schema, registry, options};
    std::ostringstream out;

    auto emitted = emitter.emit_method_set(out, broken, codegen::CallingConvention::Blocking);
    ASSERT_FALSE(emitted);
    EXPECT_EQ(emitted.error(), "Event of operation 'inspect': Type 'rpc_packet_t' has no domain mapping");
}
