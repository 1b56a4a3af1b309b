#include "glossary.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace paper_mt {

using json = nlohmann::json;

bool parse_glossary_json(const std::string& json_text, std::vector<GlossaryEntry>& out_entries, std::string& error) {
    out_entries.clear();

    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& ex) {
        error = std::string("Invalid glossary JSON: ") + ex.what();
        return false;
    }

    if (!root.is_array()) {
        error = "Glossary JSON must be an array of {\"term\", \"translation\"} objects";
        return false;
    }

    for (std::size_t i = 0; i < root.size(); ++i) {
        const json& item = root[i];
        if (!item.is_object()) {
            error = "Glossary entry " + std::to_string(i) + " is not an object";
            return false;
        }

        const auto term = item.find("term");
        const auto translation = item.find("translation");
        if (term == item.end() || !term->is_string() || translation == item.end() || !translation->is_string()) {
            error = "Glossary entry " + std::to_string(i) + " needs string fields \"term\" and \"translation\"";
            return false;
        }

        out_entries.push_back(GlossaryEntry{term->get<std::string>(), translation->get<std::string>()});
    }

    return true;
}

bool load_glossary(const std::filesystem::path& path, std::vector<GlossaryEntry>& out_entries, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Glossary file not found: " + path.string();
        return false;
    }

    std::ostringstream ss;
    ss << in.rdbuf();

    if (!parse_glossary_json(ss.str(), out_entries, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

std::string format_glossary(const std::vector<GlossaryEntry>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        out += "- " + entry.term + " > " + entry.translation;
    }
    return out;
}

}  // namespace paper_mt
