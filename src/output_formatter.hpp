#pragma once

#include <filesystem>
#include <string>

namespace paper_mt {

inline constexpr const char* kOutputIndent = "  ";

// Prefixes every non-blank line that is not already indented with two
// spaces. Blank lines are kept as they are.
std::string indent_text(const std::string& text);

bool format_output_file(const std::filesystem::path& path, std::string& error);

}  // namespace paper_mt
