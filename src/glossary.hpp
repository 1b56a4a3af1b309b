#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace paper_mt {

struct GlossaryEntry {
    std::string term;
    std::string translation;
};

// Parses a JSON array of {"term": ..., "translation": ...} objects.
bool parse_glossary_json(const std::string& json_text, std::vector<GlossaryEntry>& out_entries, std::string& error);

bool load_glossary(const std::filesystem::path& path, std::vector<GlossaryEntry>& out_entries, std::string& error);

// One "- term > translation" line per entry, without a trailing newline.
std::string format_glossary(const std::vector<GlossaryEntry>& entries);

}  // namespace paper_mt
