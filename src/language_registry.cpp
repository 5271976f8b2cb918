#include "language_registry.hpp"
#include <algorithm>
#include <cctype>

namespace codesync {

namespace {

bool contains(const std::vector<std::string>& kinds, std::string_view kind) {
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

const std::vector<std::string> kCommentKinds = {
    "comment", "line_comment", "block_comment", "doc_comment", "documentation_comment"
};

std::vector<LanguageSpec> build_table() {
    std::vector<LanguageSpec> table;

    table.push_back({"rust", {".rs"}, {}, tree_sitter_rust,
                     {"function_item", "struct_item", "impl_item"},
                     kCommentKinds, {"attribute_item"}, {}, {}, {}});

    table.push_back({"python", {".py", ".pyi"}, {}, tree_sitter_python,
                     {"function_definition"},
                     kCommentKinds, {"decorator"}, {"decorated_definition"}, {}, {}});

    table.push_back({"javascript", {".js", ".jsx", ".mjs", ".cjs"}, {}, tree_sitter_javascript,
                     {"function_declaration", "function_expression", "generator_function_declaration",
                      "method_definition"},
                     kCommentKinds, {"decorator"}, {"export_statement"}, {}, {}});

    // TSX is a superset of TypeScript, so one grammar covers both.
    table.push_back({"typescript", {".ts", ".tsx", ".mts", ".cts"}, {}, tree_sitter_tsx,
                     {"function_declaration", "function_expression", "generator_function_declaration",
                      "method_definition"},
                     kCommentKinds, {"decorator"}, {"export_statement"}, {}, {}});

    table.push_back({"go", {".go"}, {}, tree_sitter_go,
                     {"function_declaration", "method_declaration"},
                     kCommentKinds, {}, {}, {}, {}});

    table.push_back({"java", {".java"}, {}, tree_sitter_java,
                     {"method_declaration", "constructor_declaration"},
                     kCommentKinds, {}, {}, {}, {}});

    table.push_back({"c", {".c"}, {}, tree_sitter_c,
                     {"function_definition"},
                     kCommentKinds, {}, {}, {}, {}});

    table.push_back({"cpp", {".cpp", ".cc", ".cxx", ".c++", ".hpp", ".hh", ".hxx", ".h"}, {}, tree_sitter_cpp,
                     {"function_definition"},
                     kCommentKinds, {}, {"template_declaration"}, {}, {}});

    table.push_back({"ruby", {".rb", ".rake", ".gemspec"}, {"Gemfile", "Rakefile"}, tree_sitter_ruby,
                     {"method", "singleton_method"},
                     kCommentKinds, {}, {}, {}, {}});

    table.push_back({"bash", {".sh", ".bash", ".zsh"}, {}, tree_sitter_bash,
                     {"function_definition"},
                     kCommentKinds, {}, {}, {}, {}});

    table.push_back({"markdown", {".md", ".markdown"}, {}, tree_sitter_markdown,
                     {"fenced_code_block", "list", "paragraph"},
                     {}, {}, {}, {"list"}, {"atx_heading", "setext_heading"}, {"paragraph", "list"}});

    return table;
}

} // namespace

bool LanguageSpec::is_function(std::string_view kind) const { return contains(function_kinds, kind); }
bool LanguageSpec::is_comment(std::string_view kind) const { return contains(comment_kinds, kind); }
bool LanguageSpec::is_attribute(std::string_view kind) const { return contains(attribute_kinds, kind); }
bool LanguageSpec::is_wrapper(std::string_view kind) const { return contains(wrapper_kinds, kind); }
bool LanguageSpec::is_container(std::string_view kind) const { return contains(container_kinds, kind); }
bool LanguageSpec::is_heading(std::string_view kind) const { return contains(heading_kinds, kind); }
bool LanguageSpec::is_titled(std::string_view kind) const { return contains(titled_kinds, kind); }

const std::vector<LanguageSpec>& LanguageRegistry::languages() {
    static const std::vector<LanguageSpec> table = build_table();
    return table;
}

const LanguageSpec* LanguageRegistry::for_path(const std::filesystem::path& path) {
    std::string file_name = path.filename().string();
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& lang : languages()) {
        if (contains(lang.file_names, file_name)) return &lang;
    }
    if (ext.empty()) return nullptr;
    for (const auto& lang : languages()) {
        if (contains(lang.extensions, ext)) return &lang;
    }
    return nullptr;
}

const LanguageSpec* LanguageRegistry::by_name(std::string_view name) {
    for (const auto& lang : languages()) {
        if (lang.name == name) return &lang;
    }
    return nullptr;
}

} // namespace codesync
