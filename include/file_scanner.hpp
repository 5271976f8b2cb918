#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "PrefixTrie.hpp"
#include "language_registry.hpp"

namespace codesync {

namespace fs = std::filesystem;

// Per-project filter, read from <root>/.codesync/config.json.
struct ProjectFilter {
    std::vector<std::string> allowed_extensions; // dot-free, lower-case; empty = all
    std::vector<std::string> allowed_languages;  // registry names; empty = all
    std::vector<std::string> ignored_paths;
    std::vector<std::string> included_paths;
    uint64_t max_file_size = 1000000;
};

struct ScannedFile {
    fs::path absolute_path;
    std::string relative_path; // '/'-separated
    const LanguageSpec* language = nullptr;
};

// Git wildcard match: '*' and '?' stop at '/', "**" crosses directories,
// "[a-z]" / "[!a-z]" classes, '\' escapes.
bool glob_match(std::string_view pattern, std::string_view text);

// Rules of one .gitignore-style file, relative to the directory holding it.
class IgnoreRules {
public:
    enum class Verdict { None, Ignore, Keep };

    IgnoreRules() = default;
    IgnoreRules(std::string base, const std::string& text);

    static IgnoreRules load(const fs::path& file, std::string base);

    // `relative_path` is relative to the project root. Last matching line wins.
    Verdict match(const std::string& relative_path, bool is_dir) const;
    bool empty() const { return patterns_.empty(); }

private:
    struct Pattern {
        std::string glob;
        bool negated = false;
        bool dir_only = false;
        bool anchored = false; // contains a '/' other than a trailing one
    };

    std::string base_; // directory of the ignore file, relative to root, "" for root
    std::vector<Pattern> patterns_;
};

class FileScanner {
public:
    FileScanner(fs::path root, ProjectFilter filter);

    // Every file under root that a registered grammar claims and no rule drops,
    // sorted by relative path.
    std::vector<ScannedFile> scan() const;

    // Reads the project filter; missing file = defaults, corrupt file = logged defaults.
    static ProjectFilter load_config(const fs::path& root);

    static const std::vector<std::string>& ignore_file_names();
    static bool is_vcs_dir(const std::string& name);

private:
    fs::path root_;
    ProjectFilter filter_;
    PrefixTrie path_rules_;

    void scan_directory_recursive(const fs::path& current_dir,
                                  std::vector<IgnoreRules>& rule_stack,
                                  std::vector<ScannedFile>& results,
                                  bool parent_ignored) const;
    bool is_ignored(const std::vector<IgnoreRules>& rule_stack, const std::string& rel, bool is_dir) const;
    bool accepts_file(const fs::path& path, const LanguageSpec*& language) const;
};

} // namespace codesync
