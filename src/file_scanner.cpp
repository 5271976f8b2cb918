#include "file_scanner.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace codesync {

namespace {

std::string normalize_extension(std::string ext) {
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// Parses "[...]" at pattern[pos]. Returns false when the class is unterminated,
// in which case '[' is an ordinary character.
bool match_class(std::string_view pattern, size_t& pos, char c, bool& matched) {
    size_t j = pos + 1;
    bool negate = false;
    if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
        negate = true;
        ++j;
    }

    bool hit = false;
    bool first = true;
    while (j < pattern.size() && (pattern[j] != ']' || first)) {
        first = false;
        char lo = pattern[j];
        if (lo == '\\' && j + 1 < pattern.size()) lo = pattern[++j];
        if (j + 2 < pattern.size() && pattern[j + 1] == '-' && pattern[j + 2] != ']') {
            char hi = pattern[j + 2];
            if (c >= lo && c <= hi) hit = true;
            j += 3;
        } else {
            if (c == lo) hit = true;
            ++j;
        }
    }
    if (j >= pattern.size()) return false;

    pos = j + 1;
    matched = (hit != negate) && c != '/';
    return true;
}

bool glob_match_from(std::string_view p, std::string_view t) {
    size_t pi = 0;
    size_t ti = 0;

    while (pi < p.size()) {
        char c = p[pi];

        if (c == '*') {
            if (pi + 1 < p.size() && p[pi + 1] == '*') {
                size_t next = pi + 2;
                if (next < p.size() && p[next] == '/') {
                    // "**/" matches zero or more whole directories
                    std::string_view rest = p.substr(next + 1);
                    if (glob_match_from(rest, t.substr(ti))) return true;
                    for (size_t k = ti; k < t.size(); ++k) {
                        if (t[k] == '/' && glob_match_from(rest, t.substr(k + 1))) return true;
                    }
                    return false;
                }
                std::string_view rest = p.substr(next);
                for (size_t k = ti; k <= t.size(); ++k) {
                    if (glob_match_from(rest, t.substr(k))) return true;
                }
                return false;
            }

            std::string_view rest = p.substr(pi + 1);
            for (size_t k = ti; k <= t.size(); ++k) {
                if (glob_match_from(rest, t.substr(k))) return true;
                if (k < t.size() && t[k] == '/') break;
            }
            return false;
        }

        if (ti >= t.size()) return false;

        if (c == '?') {
            if (t[ti] == '/') return false;
            ++pi;
            ++ti;
            continue;
        }

        if (c == '[') {
            bool matched = false;
            size_t pos = pi;
            if (match_class(p, pos, t[ti], matched)) {
                if (!matched) return false;
                pi = pos;
                ++ti;
                continue;
            }
        }

        if (c == '\\' && pi + 1 < p.size()) c = p[++pi];
        if (c != t[ti]) return false;
        ++pi;
        ++ti;
    }
    return ti == t.size();
}

std::string relative_generic(const fs::path& path, const fs::path& root) {
    std::string rel = path.lexically_relative(root).generic_string();
    if (rel == ".") return "";
    return rel;
}

} // namespace

bool glob_match(std::string_view pattern, std::string_view text) {
    return glob_match_from(pattern, text);
}

// --- IGNORE RULES ---

IgnoreRules::IgnoreRules(std::string base, const std::string& text) : base_(std::move(base)) {
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        // Trailing spaces are dropped unless escaped.
        while (!line.empty() && line.back() == ' ' &&
               !(line.size() >= 2 && line[line.size() - 2] == '\\')) {
            line.pop_back();
        }
        if (line.empty()) continue;

        Pattern pat;
        if (line[0] == '!') {
            pat.negated = true;
            line = line.substr(1);
        } else if (line.size() >= 2 && line[0] == '\\' && (line[1] == '!' || line[1] == '#')) {
            line = line.substr(1);
        }

        if (!line.empty() && line.back() == '/') {
            pat.dir_only = true;
            line.pop_back();
        }
        if (!line.empty() && line[0] == '/') {
            pat.anchored = true;
            line = line.substr(1);
        }
        if (line.find('/') != std::string::npos) pat.anchored = true;
        if (line.empty()) continue;

        pat.glob = line;
        patterns_.push_back(std::move(pat));
    }
}

IgnoreRules IgnoreRules::load(const fs::path& file, std::string base) {
    std::ifstream f(file, std::ios::binary);
    if (!f.is_open()) {
        spdlog::warn("⚠️ Cannot read ignore file {}", file.string());
        return IgnoreRules();
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return IgnoreRules(std::move(base), text);
}

IgnoreRules::Verdict IgnoreRules::match(const std::string& relative_path, bool is_dir) const {
    std::string_view local = relative_path;
    if (!base_.empty()) {
        if (local.size() <= base_.size() || local.compare(0, base_.size(), base_) != 0 ||
            local[base_.size()] != '/') {
            return Verdict::None;
        }
        local = local.substr(base_.size() + 1);
    }

    std::string_view name = local;
    size_t slash = local.rfind('/');
    if (slash != std::string_view::npos) name = local.substr(slash + 1);

    for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
        if (it->dir_only && !is_dir) continue;
        if (glob_match(it->glob, it->anchored ? local : name)) {
            return it->negated ? Verdict::Keep : Verdict::Ignore;
        }
    }
    return Verdict::None;
}

// --- FILE SCANNER ---

FileScanner::FileScanner(fs::path root, ProjectFilter filter)
    : root_(std::move(root)), filter_(std::move(filter)) {
    for (auto& ext : filter_.allowed_extensions) ext = normalize_extension(ext);

    for (const auto& p : filter_.ignored_paths) {
        if (!p.empty()) path_rules_.insert(p, PathFlag::IGNORE);
    }
    for (const auto& p : filter_.included_paths) {
        if (!p.empty()) path_rules_.insert(p, PathFlag::INCLUDE);
    }
}

const std::vector<std::string>& FileScanner::ignore_file_names() {
    static const std::vector<std::string> names = {".gitignore", ".ignore", ".codesyncignore"};
    return names;
}

bool FileScanner::is_vcs_dir(const std::string& name) {
    return name == ".git" || name == ".hg" || name == ".svn" || name == ".bzr" || name == "_darcs";
}

ProjectFilter FileScanner::load_config(const fs::path& root) {
    ProjectFilter filter;
    fs::path config_path = root / ".codesync" / "config.json";

    if (!fs::exists(config_path)) {
        config_path = root / "codesync.json";
    }
    if (!fs::exists(config_path)) return filter;

    try {
        std::ifstream f(config_path);
        auto j = nlohmann::json::parse(f);
        filter.allowed_extensions = j.value("allowed_extensions", std::vector<std::string>{});
        filter.allowed_languages = j.value("allowed_languages", std::vector<std::string>{});
        filter.ignored_paths = j.value("ignored_paths", std::vector<std::string>{});
        filter.included_paths = j.value("included_paths", std::vector<std::string>{});
        filter.max_file_size = j.value("max_file_size", filter.max_file_size);
        spdlog::info("⚙️  Project config: {} ignores, {} exceptions.",
                     filter.ignored_paths.size(), filter.included_paths.size());
    } catch (const std::exception& e) {
        spdlog::error("❌ Config corrupted at {}: {}", config_path.string(), e.what());
        return ProjectFilter();
    }
    return filter;
}

bool FileScanner::is_ignored(const std::vector<IgnoreRules>& rule_stack, const std::string& rel, bool is_dir) const {
    // Deeper ignore files override shallower ones.
    for (auto it = rule_stack.rbegin(); it != rule_stack.rend(); ++it) {
        auto verdict = it->match(rel, is_dir);
        if (verdict != IgnoreRules::Verdict::None) return verdict == IgnoreRules::Verdict::Ignore;
    }
    return false;
}

bool FileScanner::accepts_file(const fs::path& path, const LanguageSpec*& language) const {
    language = LanguageRegistry::for_path(path);
    if (!language) return false;

    if (!filter_.allowed_languages.empty() &&
        std::find(filter_.allowed_languages.begin(), filter_.allowed_languages.end(), language->name) ==
            filter_.allowed_languages.end()) {
        return false;
    }

    if (!filter_.allowed_extensions.empty()) {
        std::string ext = normalize_extension(path.extension().string());
        return std::find(filter_.allowed_extensions.begin(), filter_.allowed_extensions.end(), ext) !=
               filter_.allowed_extensions.end();
    }
    return true;
}

void FileScanner::scan_directory_recursive(
    const fs::path& current_dir,
    std::vector<IgnoreRules>& rule_stack,
    std::vector<ScannedFile>& results,
    bool parent_ignored
) const {
    const std::string dir_rel = relative_generic(current_dir, root_);

    size_t pushed = 0;
    for (const auto& name : ignore_file_names()) {
        std::error_code ec;
        fs::path ignore_file = current_dir / name;
        if (!fs::is_regular_file(ignore_file, ec)) continue;
        auto rules = IgnoreRules::load(ignore_file, dir_rel);
        if (!rules.empty()) {
            rule_stack.push_back(std::move(rules));
            ++pushed;
        }
    }

    std::error_code ec;
    fs::directory_iterator it(current_dir, fs::directory_options::skip_permission_denied, ec);

    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code status_ec;
        auto status = entry.symlink_status(status_ec);
        if (status_ec) continue;

        std::string name = entry.path().filename().string();
        std::string rel = dir_rel.empty() ? name : dir_rel + "/" + name;

        if (fs::is_symlink(status)) {
            spdlog::debug("LINK | {} | Action: SKIP", rel);
            continue;
        }

        uint8_t flags = path_rules_.check(fs::path(rel));
        bool included = flags & PathFlag::INCLUDE;
        bool bridge = flags & PathFlag::BRIDGE;
        bool explicitly_ignored = flags & PathFlag::IGNORE;

        if (fs::is_directory(status)) {
            if (is_vcs_dir(name)) continue;

            // Bridged-into directories stay ignored for everything not included.
            bool ignored = !included &&
                           (parent_ignored || explicitly_ignored || is_ignored(rule_stack, rel, true));
            bool enter = !ignored || bridge;
            spdlog::debug("DIR  | {} | Ignored: {} | Bridge: {} | Action: {}",
                          rel, ignored ? "YES" : "NO ", bridge ? "YES" : "NO ", enter ? "ENTER" : "SKIP");

            if (enter) scan_directory_recursive(entry.path(), rule_stack, results, ignored);
        } else if (fs::is_regular_file(status)) {
            bool ignored = !included &&
                           (parent_ignored || explicitly_ignored || is_ignored(rule_stack, rel, false));
            const LanguageSpec* language = nullptr;
            bool accepted = accepts_file(entry.path(), language);
            if (included && !accepted && language) accepted = true;

            if (!ignored && accepted) {
                spdlog::debug("FILE | {} | Action: COLLECT ({})", rel, language->name);
                results.push_back({entry.path(), rel, language});
            } else {
                spdlog::debug("FILE | {} | Action: SKIP (Ignored: {}, Grammar: {})",
                              rel, ignored ? "YES" : "NO ", language ? language->name : "none");
            }
        }
    }
    if (ec) {
        spdlog::warn("⚠️ Scanner error at {}: {}", current_dir.string(), ec.message());
    }

    rule_stack.resize(rule_stack.size() - pushed);
}

std::vector<ScannedFile> FileScanner::scan() const {
    std::error_code ec;
    std::vector<ScannedFile> results;

    if (fs::is_regular_file(root_, ec)) {
        const LanguageSpec* language = nullptr;
        if (accepts_file(root_, language)) {
            results.push_back({root_, root_.filename().generic_string(), language});
        }
        return results;
    }
    if (!fs::is_directory(root_, ec)) {
        throw IOError("Not a directory: " + root_.string());
    }

    std::vector<IgnoreRules> rule_stack;
    scan_directory_recursive(root_, rule_stack, results, false);

    std::sort(results.begin(), results.end(), [](const ScannedFile& a, const ScannedFile& b) {
        return a.relative_path < b.relative_path;
    });
    spdlog::info("🔍 Scanned {} | {} candidate files", root_.string(), results.size());
    return results;
}

} // namespace codesync
