#include <gtest/gtest.h>

#include "codegen/generator.hpp"
#include "file_writer.hpp"
#include "frontend/diagnostic.hpp"
#include "frontend/frontend.hpp"
#include "frontend/semantic/validator.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace ctbind;

namespace
{

const std::string kLedgerSchema = std::string(CTBIND_SOURCE_DIR) + "/schemas/ledger.ctbs";

std::string read(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::size_t position(const std::string& text, const std::string& needle)
{
    const auto pos = text.find(needle);
    EXPECT_NE(pos, std::string::npos) << "missing: " << needle;
    return pos;
}

}  // namespace

class Generator : public ::testing::Test
{
protected:
    std::filesystem::path temp_dir;

    void SetUp() override
    {
        temp_dir = std::filesystem::temp_directory_path() / "ctbind_generator_tests";
        std::filesystem::create_directories(temp_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }
};

TEST_F(Generator, LedgerSchemaIsValid)
{
    auto program = frontend::parse_program(kLedgerSchema);
    ASSERT_TRUE(program) << program.error();

    frontend::DiagnosticSink sink;
    frontend::semantic::Validator validator{*program, sink};
    validator.run();
    for (const auto& diagnostic : sink.diagnostics()) {
        ADD_FAILURE() << frontend::format_diagnostic(diagnostic);
    }
}

TEST_F(Generator, RenderLedgerSchema)
{
    auto program = frontend::parse_program(kLedgerSchema);
    ASSERT_TRUE(program) << program.error();

    codegen::Generator generator{*program, {}};
    auto rendered = generator.render();
    ASSERT_TRUE(rendered) << rendered.error();
    const auto& text = *rendered;

    // sections appear in a fixed order
    const auto banner = position(text, "## This file was auto-generated by ctbind ##");
    const auto operation_enum = position(text, "class Operation(enum.IntEnum):\n");
    const auto flags = position(text, "class AccountFlags(enum.IntFlag):\n");
    const auto dataclass = position(text, "@dataclass\nclass Account:\n");
    const auto packet = position(text, "class CPacket(ctypes.Structure):\n");
    const auto account = position(text, "class CAccount(ctypes.Structure):\n");
    const auto lifecycle = position(text, "OnCompletion = ctypes.CFUNCTYPE(");
    const auto async_mixin = position(text, "class AsyncStateMachineMixin:\n");
    const auto mixin = position(text, "class StateMachineMixin:\n");

    EXPECT_LT(banner, operation_enum);
    EXPECT_LT(operation_enum, flags);
    EXPECT_LT(flags, dataclass);
    EXPECT_LT(dataclass, packet);
    EXPECT_LT(packet, account);
    EXPECT_LT(account, lifecycle);
    EXPECT_LT(lifecycle, async_mixin);
    EXPECT_LT(async_mixin, mixin);

    EXPECT_NE(text.find("    PULSE = 128\n"), std::string::npos);
    EXPECT_EQ(text.find("    ROOT = 1\n"), std::string::npos);
    EXPECT_NE(text.find("    CLOSED = 1 << 5\n"), std::string::npos);
    EXPECT_EQ(text.find("PADDING"), std::string::npos);
    EXPECT_NE(text.find("    def lookup_accounts(self, accounts: list[int]) -> list[Account]:\n"), std::string::npos);
    EXPECT_NE(text.find("    async def get_account_balances(self, filter: AccountFilter) -> list[AccountBalance]:\n"),
              std::string::npos);
    EXPECT_EQ(text.find("def pulse"), std::string::npos);

    // one method per convention for every operation except the heartbeat
    std::size_t methods = 0;
    for (auto pos = text.find("def create_accounts("); pos != std::string::npos;
         pos = text.find("def create_accounts(", pos + 1)) {
        ++methods;
    }
    EXPECT_EQ(methods, 2u);

    // the protocol packet has no value record
    EXPECT_EQ(text.find("class Packet:"), std::string::npos);
}

TEST_F(Generator, LedgerKeepsEveryResultCode)
{
    auto program = frontend::parse_program(kLedgerSchema);
    ASSERT_TRUE(program) << program.error();

    codegen::Generator generator{*program, {}};
    auto rendered = generator.render();
    ASSERT_TRUE(rendered) << rendered.error();

    const auto result_enum = position(*rendered, "class CreateTransferResult(enum.IntEnum):\n");
    const auto reserved_flag = position(*rendered, "    RESERVED_FLAG = 4\n");
    EXPECT_LT(result_enum, reserved_flag);
}

TEST_F(Generator, OperationPayloadThroughAlias)
{
    auto program = frontend::detail::parse_file_content(R"(
        extern struct Rec { id: u64; }
        alias RecAlias = Rec;
        map Rec = "Rec";
        operation echo = 10 (recs: batch<RecAlias>) -> RecAlias;
    )",
                                                        "alias.ctbs");
    ASSERT_TRUE(program) << program.error();

    frontend::DiagnosticSink sink;
    frontend::semantic::Validator validator{*program, sink};
    validator.run();
    ASSERT_FALSE(sink.has_errors());

    codegen::Generator generator{*program, {}};
    auto rendered = generator.render();
    ASSERT_TRUE(rendered) << rendered.error();
    EXPECT_NE(rendered->find("    def echo(self, recs: list[Rec]) -> list[Rec]:\n"
                             "        return self._submit(\n"
                             "            Operation.ECHO,\n"
                             "            recs,\n"
                             "            CRec,\n"
                             "            CRec,\n"
                             "        )\n"),
              std::string::npos)
        << *rendered;
}

TEST_F(Generator, RenderIsDeterministic)
{
    auto program = frontend::parse_program(kLedgerSchema);
    ASSERT_TRUE(program) << program.error();

    codegen::Generator generator{*program, {}};
    auto first = generator.render();
    auto second = generator.render();
    ASSERT_TRUE(first) << first.error();
    ASSERT_TRUE(second) << second.error();
    EXPECT_EQ(*first, *second);
}

TEST_F(Generator, FailureProducesNoOutput)
{
    auto program = frontend::detail::parse_file_content(R"(
        extern struct Good { a: u8; }
        extern struct Bad { a: i32; }
        map Good = "Good";
        map Bad = "Bad";
    )",
                                                        "bad.ctbs");
    ASSERT_TRUE(program) << program.error();

    const auto output = temp_dir / "bindings.py";
    codegen::GenerationOptions options;
    options.output = output.string();

    codegen::Generator generator{*program, options};
    std::ostringstream out;
    auto result = generator.run(out);
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("Field 'a' of struct 'Bad'"), std::string::npos) << result.error();
    EXPECT_FALSE(std::filesystem::exists(output));
    EXPECT_TRUE(out.str().empty());
}

TEST_F(Generator, ProtocolCollisionIsRejectedBeforeEmission)
{
    auto program = frontend::detail::parse_file_content("map rpc_client_t = \"Handle\";", "collide.ctbs");
    ASSERT_TRUE(program) << program.error();

    codegen::Generator generator{*program, {}};
    auto rendered = generator.render();
    ASSERT_FALSE(rendered);
    EXPECT_EQ(rendered.error(), "Domain mapping for 'rpc_client_t' collides with the protocol mapping");
}

TEST_F(Generator, UndeclaredMappingIsRejectedBeforeEmission)
{
    auto program = frontend::detail::parse_file_content("map Ghost = \"Ghost\";", "ghost.ctbs");
    ASSERT_TRUE(program) << program.error();

    codegen::Generator generator{*program, {}};
    auto rendered = generator.render();
    ASSERT_FALSE(rendered);
    EXPECT_EQ(rendered.error(), "Mapped type 'Ghost' is not declared");
}

TEST_F(Generator, RunWritesToStdoutStream)
{
    auto program = frontend::detail::parse_file_content("enum E : u8 { a }\nmap E = \"E\";", "e.ctbs");
    ASSERT_TRUE(program) << program.error();

    codegen::Generator generator{*program, {}};
    std::ostringstream out;
    ASSERT_TRUE(generator.run(out));
    EXPECT_NE(out.str().find("class E(enum.IntEnum):\n    A = 0\n"), std::string::npos) << out.str();
}

TEST_F(Generator, RunWritesFile)
{
    auto program = frontend::detail::parse_file_content("enum E : u8 { a }\nmap E = \"E\";", "e.ctbs");
    ASSERT_TRUE(program) << program.error();

    const auto output = temp_dir / "bindings.py";
    codegen::GenerationOptions options;
    options.output = output.string();

    codegen::Generator generator{*program, options};
    std::ostringstream out;
    ASSERT_TRUE(generator.run(out));
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(read(output), *generator.render());
}

TEST_F(Generator, WriteFileIfChangedKeepsIdenticalFile)
{
    const auto path = temp_dir / "same.py";
    ASSERT_TRUE(codegen::write_file_if_changed(path, "content\n"));
    const auto first_write = std::filesystem::last_write_time(path);

    ASSERT_TRUE(codegen::write_file_if_changed(path, "content\n"));
    EXPECT_EQ(std::filesystem::last_write_time(path), first_write);
    EXPECT_FALSE(std::filesystem::exists(temp_dir / "same.py.tmp"));

    ASSERT_TRUE(codegen::write_file_if_changed(path, "changed\n"));
    EXPECT_EQ(read(path), "changed\n");
    EXPECT_FALSE(std::filesystem::exists(temp_dir / "same.py.tmp"));
}

TEST_F(Generator, WriteFileIntoMissingDirectoryFails)
{
    auto written = codegen::write_file_if_changed(temp_dir / "missing" / "out.py", "content\n");
    ASSERT_FALSE(written);
    EXPECT_TRUE(written.error().starts_with("Failed to write file"));
}

TEST_F(Generator, WriteOutputDash)
{
    std::ostringstream out;
    ASSERT_TRUE(codegen::write_output("-", "content\n", out));
    ASSERT_TRUE(codegen::write_output("", "more\n", out));
    EXPECT_EQ(out.str(), "content\nmore\n");
}
