#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

namespace codesync {

enum PathFlag : uint8_t {
    NONE = 0,
    IGNORE = 1 << 0,
    INCLUDE = 1 << 1,  // overrides IGNORE
    BRIDGE = 1 << 2    // an INCLUDE rule lives somewhere below this path
};

// Segment trie over explicit ignored_paths / included_paths from the project
// config. Paths are relative to the project root, '/'-separated.
class PrefixTrie {
    struct Node {
        std::unordered_map<std::string, std::unique_ptr<Node>> children;
        uint8_t flags = PathFlag::NONE;
        bool include_below = false;
    };

    std::unique_ptr<Node> root;

public:
    PrefixTrie() : root(std::make_unique<Node>()) {}

    void insert(const std::string& path, PathFlag flag) {
        Node* current = root.get();
        std::filesystem::path p = std::filesystem::path(path).lexically_normal();

        for (const auto& part : p) {
            std::string segment = part.string();
            if (segment == "." || segment.empty() || segment == "/") continue;

            if (flag == PathFlag::INCLUDE) current->include_below = true;
            auto& child = current->children[segment];
            if (!child) child = std::make_unique<Node>();
            current = child.get();
        }
        if (current == root.get()) return; // "" or "." would match everything
        current->flags |= flag;
    }

    // IGNORE if `path` is at or below an ignored path, INCLUDE (which wins) if
    // it is at or below an included one. BRIDGE is set when the whole path is a
    // strict prefix of some included path.
    uint8_t check(const std::filesystem::path& path) const {
        const Node* current = root.get();
        uint8_t accumulated_flags = PathFlag::NONE;
        bool walked_all = true;

        for (const auto& part : path) {
            std::string segment = part.string();
            if (segment == "." || segment.empty()) continue;

            auto it = current->children.find(segment);
            if (it == current->children.end()) {
                walked_all = false;
                break;
            }
            current = it->second.get();

            if (current->flags & PathFlag::INCLUDE) {
                accumulated_flags = PathFlag::INCLUDE;
            } else if ((current->flags & PathFlag::IGNORE) && accumulated_flags != PathFlag::INCLUDE) {
                accumulated_flags = PathFlag::IGNORE;
            }
        }

        if (walked_all && current->include_below) accumulated_flags |= PathFlag::BRIDGE;
        return accumulated_flags;
    }

    bool empty() const { return root->children.empty(); }

    void clear() {
        root = std::make_unique<Node>();
    }
};

} // namespace codesync
