#pragma once
#include <filesystem>
#include <string>

namespace codesync {

// Absolute, normalized form of `path`. Throws IOError if it does not exist
// or is not a directory.
std::filesystem::path validate_directory(const std::filesystem::path& path);

// Nearest ancestor of `start` (itself included) holding a project marker
// (.git, Cargo.toml, package.json, ...). Falls back to `start`.
std::filesystem::path find_project_root(const std::filesystem::path& start);

// "cs_<provider>_<hex>"; the same root always yields the same namespace.
std::string namespace_for(const std::filesystem::path& root, const std::string& provider);

} // namespace codesync
