#include "file_writer.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace ctbind::codegen
{

std::expected<void, std::string> write_file_if_changed(const std::filesystem::path& path,
                                                       const std::string& content)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in) {
            return std::unexpected("Failed to read existing file '" + path.string() + "'");
        }
        std::string existing{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (existing == content) {
            spdlog::debug("{} is up to date", path.string());
            return {};
        }
    }

    auto temporary = path;
    temporary += ".tmp";

    {
        std::ofstream out(temporary, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected("Failed to write file '" + temporary.string() + "'");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            fs::remove(temporary, ec);
            return std::unexpected("Failed to write file '" + temporary.string() + "'");
        }
    }

    fs::rename(temporary, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temporary, ignored);
        return std::unexpected("Failed to replace file '" + path.string() + "': " + ec.message());
    }
    return {};
}

std::expected<void, std::string> write_output(const std::string& output, const std::string& content,
                                              std::ostream& stdout_stream)
{
    if (output.empty() || output == "-") {
        stdout_stream << content;
        stdout_stream.flush();
        if (!stdout_stream) {
            return std::unexpected("Failed to write generated bindings to standard output");
        }
        return {};
    }
    return write_file_if_changed(output, content);
}

}  // namespace ctbind::codegen
