#pragma once

#include <expected>
#include <filesystem>
#include <ostream>
#include <string>

namespace ctbind::codegen
{

/**
 * @brief Replace the file at @p path with @p content.
 *
 * The content goes to a sibling temporary file that is then renamed over the
 * target, so readers never see a partially written module. A target that
 * already holds the same bytes is left untouched.
 */
std::expected<void, std::string> write_file_if_changed(const std::filesystem::path& path,
                                                       const std::string& content);

/// Write to @p stdout_stream when @p output is "-" or empty, otherwise to the named file.
std::expected<void, std::string> write_output(const std::string& output, const std::string& content,
                                              std::ostream& stdout_stream);

}  // namespace ctbind::codegen
