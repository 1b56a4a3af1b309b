#include "text_input.hpp"

#include <fstream>
#include <sstream>

namespace paper_mt {

std::vector<std::string> split_lines(const std::string& data) {
    std::vector<std::string> lines;

    std::size_t start = 0;
    while (start < data.size()) {
        const std::size_t newline = data.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(data.substr(start));
            break;
        }
        lines.push_back(data.substr(start, newline - start + 1));
        start = newline + 1;
    }

    return lines;
}

bool read_text_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& error) {
    out_lines.clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        error = "Input file not found: " + path.string();
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open input file: " + path.string();
        return false;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        error = "Failed to read input file: " + path.string();
        return false;
    }

    out_lines = split_lines(ss.str());
    return true;
}

}  // namespace paper_mt
