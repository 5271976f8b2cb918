#include "project.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include <spdlog/spdlog.h>

namespace codesync {

namespace fs = std::filesystem;

namespace {

// Ordered by priority: version control first, then package manifests and
// build files, then editor workspaces.
const char* const kProjectIndicators[] = {
    ".git", ".hg", ".svn", "_darcs", ".bzr",
    "Cargo.toml", "package.json", "tsconfig.json", "deno.json", "deno.jsonc",
    "pyproject.toml", "setup.py", "requirements.txt", "Pipfile", "poetry.lock", "environment.yml",
    "go.mod", "Gemfile", "composer.json",
    "mkdocs.yml", "_config.yml", "gatsby-config.js", "next.config.js", "nuxt.config.js",
    "docusaurus.config.js", "hugo.toml", "hugo.yaml",
    "stack.yaml", "cabal.project", "Gemfile.lock", "yarn.lock", "pnpm-lock.yaml", "bun.lockb",
    "pubspec.yaml", "mix.exs", "rebar.config", "deps.edn", "project.clj", "build.sbt",
    "Package.swift", "Podfile", "Cartfile",
    "pom.xml", "build.gradle", "build.gradle.kts", "build.xml", "CMakeLists.txt", "Makefile",
    "meson.build", "configure.ac", "configure.in", "Dockerfile", "docker-compose.yml", "Vagrantfile",
    ".editorconfig", ".vscode", ".idea", ".codesync"
};

} // namespace

fs::path validate_directory(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw IOError("Directory '" + path.string() + "' does not exist");
    }
    if (!fs::is_directory(path, ec)) {
        throw IOError("'" + path.string() + "' exists but is not a directory");
    }
    fs::path canonical = fs::canonical(path, ec);
    if (ec) throw IOError("Cannot resolve '" + path.string() + "': " + ec.message());
    return canonical;
}

fs::path find_project_root(const fs::path& start) {
    fs::path origin = validate_directory(start);

    for (fs::path current = origin;; current = current.parent_path()) {
        for (const char* indicator : kProjectIndicators) {
            std::error_code ec;
            if (fs::exists(current / indicator, ec)) {
                spdlog::debug("Project root {} (found {})", current.string(), indicator);
                return current;
            }
        }
        if (current == current.root_path() || current.parent_path() == current) break;
    }
    return origin;
}

std::string namespace_for(const fs::path& root, const std::string& provider) {
    std::string key = root.lexically_normal().generic_string();
    if (key.size() > 1 && key.back() == '/') key.pop_back();
    return "cs_" + provider + "_" + to_hex(xxhash64(key));
}

} // namespace codesync
