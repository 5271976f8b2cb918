#pragma once
#include <tree_sitter/api.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// Grammars are linked as separate libraries (tree-sitter-<lang>).
extern "C" {
    const TSLanguage* tree_sitter_rust();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_tsx();
    const TSLanguage* tree_sitter_go();
    const TSLanguage* tree_sitter_java();
    const TSLanguage* tree_sitter_c();
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_ruby();
    const TSLanguage* tree_sitter_bash();
    const TSLanguage* tree_sitter_markdown();
}

namespace codesync {

// Extraction rules for one grammar. Adding a language is adding a row.
struct LanguageSpec {
    std::string name;
    std::vector<std::string> extensions;   // lower-case, with the dot
    std::vector<std::string> file_names;   // exact names without extension (Gemfile)
    const TSLanguage* (*grammar)();
    std::vector<std::string> function_kinds;
    std::vector<std::string> comment_kinds;
    std::vector<std::string> attribute_kinds; // absorbed into the leading span
    std::vector<std::string> wrapper_kinds;   // parent nodes whose start opens the span
    std::vector<std::string> container_kinds; // nothing below these is emitted on its own
    std::vector<std::string> heading_kinds;   // section titles, never chunks themselves
    std::vector<std::string> titled_kinds;    // chunks that get the closest heading prepended
    uint32_t max_comment_gap = 1;             // blank lines allowed between comment and span

    bool is_function(std::string_view kind) const;
    bool is_comment(std::string_view kind) const;
    bool is_attribute(std::string_view kind) const;
    bool is_wrapper(std::string_view kind) const;
    bool is_container(std::string_view kind) const;
    bool is_heading(std::string_view kind) const;
    bool is_titled(std::string_view kind) const;
};

class LanguageRegistry {
public:
    static const std::vector<LanguageSpec>& languages();

    // nullptr when no grammar claims the file.
    static const LanguageSpec* for_path(const std::filesystem::path& path);
    static const LanguageSpec* by_name(std::string_view name);
};

} // namespace codesync
