#pragma once

#include <string>

namespace paper_mt {

extern const char* const kDefaultPromptTemplate;

// Substitutes {target_language}, {glossary} and {text} in a single pass, so
// placeholder-like text inside the substituted values is left untouched.
// Unknown {...} sequences are copied verbatim.
std::string render_prompt(
    const std::string& prompt_template,
    const std::string& target_language,
    const std::string& glossary,
    const std::string& text
);

}  // namespace paper_mt
