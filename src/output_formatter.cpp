#include "output_formatter.hpp"

#include "text_input.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace paper_mt {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::string indent_text(const std::string& text) {
    std::string out;
    out.reserve(text.size() + text.size() / 16);

    for (const auto& line : split_lines(text)) {
        if (!is_blank(line) && line.rfind(kOutputIndent, 0) != 0) {
            out += kOutputIndent;
        }
        out += line;
    }
    return out;
}

bool format_output_file(const std::filesystem::path& path, std::string& error) {
    std::string content;
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            error = "Failed to open output for formatting: " + path.string();
            return false;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        content = ss.str();
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Failed to rewrite formatted output: " + path.string();
        return false;
    }

    out << indent_text(content);
    out.flush();
    if (!out) {
        error = "Failed to write formatted output: " + path.string();
        return false;
    }
    return true;
}

}  // namespace paper_mt
