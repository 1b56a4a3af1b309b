#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace paper_mt {

// Reads a UTF-8 text file into lines. Every line keeps its trailing '\n'; the
// last line has none when the file does not end with a newline.
bool read_text_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& error);

std::vector<std::string> split_lines(const std::string& data);

}  // namespace paper_mt
