#include "chunker.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>
#include <omp.h>
#include <chrono>
#include <cstring>
#include <fstream>
#include <limits>
#include <memory>
#include <optional>
#include <stack>
#include <unordered_set>

namespace codesync {

namespace fs = std::filesystem;

namespace {

constexpr size_t kBinarySniffBytes = 8192;

struct WalkItem {
    TSNode node;
    bool in_container;
};

std::string_view node_text(TSNode node, std::string_view source) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= source.size()) return {};
    return source.substr(start, std::min<size_t>(end, source.size()) - start);
}

TSNode child_by_field(TSNode node, const char* field) {
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(std::strlen(field)));
}

// Last row actually occupied by the node. Nodes that swallow their trailing
// newline end at column 0 of the next row.
uint32_t last_row(TSNode node) {
    TSPoint start = ts_node_start_point(node);
    TSPoint end = ts_node_end_point(node);
    if (end.column == 0 && end.row > start.row) return end.row - 1;
    return end.row;
}

// True when only whitespace precedes `byte` on its line.
bool starts_own_line(std::string_view source, uint32_t byte) {
    while (byte > 0) {
        char c = source[byte - 1];
        if (c == '\n') return true;
        if (c != ' ' && c != '\t' && c != '\r') return false;
        --byte;
    }
    return true;
}

bool is_name_node(const char* type) {
    static const char* kinds[] = {
        "identifier", "field_identifier", "qualified_identifier", "destructor_name",
        "operator_name", "type_identifier", "property_identifier", "scoped_identifier"
    };
    for (const char* k : kinds) {
        if (std::strcmp(type, k) == 0) return true;
    }
    return false;
}

// Best-effort identifier: the "name" field, else down the C-style declarator
// chain (pointer/reference/function declarators), else the impl "type".
std::optional<std::string> extract_name(TSNode node, std::string_view source) {
    TSNode current = node;
    for (int depth = 0; depth < 8; ++depth) {
        TSNode name = child_by_field(current, "name");
        if (!ts_node_is_null(name)) return std::string(node_text(name, source));

        TSNode declarator = child_by_field(current, "declarator");
        if (ts_node_is_null(declarator)) break;
        if (is_name_node(ts_node_type(declarator))) return std::string(node_text(declarator, source));
        current = declarator;
    }

    if (std::strcmp(ts_node_type(node), "impl_item") == 0) {
        TSNode type = child_by_field(node, "type");
        if (!ts_node_is_null(type)) return std::string(node_text(type, source));
    }
    return std::nullopt;
}

std::string trim_trailing(std::string_view text) {
    size_t end = text.size();
    while (end > 0 && (text[end - 1] == '\n' || text[end - 1] == '\r' ||
                       text[end - 1] == ' ' || text[end - 1] == '\t')) {
        --end;
    }
    return std::string(text.substr(0, end));
}

} // namespace

// --- FILE READING ---

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

bool read_source_file(const fs::path& path, uint64_t max_file_size, std::string& out) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) throw IOError("cannot stat: " + ec.message());
    if (size == 0) return false;
    if (size > max_file_size) {
        throw IOError("file too large (" + std::to_string(size) + " bytes, limit " +
                      std::to_string(max_file_size) + ")");
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw IOError("cannot open for reading");
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) throw IOError("read failed");
    if (out.empty()) return false;

    std::string_view head(out.data(), std::min(out.size(), kBinarySniffBytes));
    if (head.find('\0') != std::string_view::npos) return false;

    if (!is_valid_utf8(out)) throw IOError("not valid UTF-8");
    return true;
}

// --- EXTRACTOR ---

ChunkExtractor::ChunkExtractor() : parser_(ts_parser_new()) {}

ChunkExtractor::~ChunkExtractor() {
    if (parser_) ts_parser_delete(parser_);
}

std::vector<Chunk> ChunkExtractor::extract(
    const std::string& relative_path,
    std::string_view source,
    const LanguageSpec& language,
    bool hash_only,
    bool& had_errors
) {
    had_errors = false;
    if (source.size() > std::numeric_limits<uint32_t>::max()) {
        throw ParseError("source exceeds parser limits");
    }
    if (!ts_parser_set_language(parser_, language.grammar())) {
        throw ParseError("grammar '" + language.name + "' is incompatible with the tree-sitter runtime");
    }

    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
        ts_parser_parse_string(parser_, nullptr, source.data(), static_cast<uint32_t>(source.size())),
        ts_tree_delete);
    if (!tree) throw ParseError("parser produced no tree");

    TSNode root = ts_tree_root_node(tree.get());
    had_errors = ts_node_has_error(root);

    std::vector<Chunk> found;
    std::unordered_set<ChunkKey, ChunkKeyHash> seen;
    std::string last_heading;

    // Non-recursive, document order: children are pushed in reverse.
    std::stack<WalkItem> stack;
    stack.push({root, false});

    while (!stack.empty()) {
        WalkItem item = stack.top();
        stack.pop();

        TSNode node = item.node;
        const char* type = ts_node_type(node);

        if (language.is_heading(type)) {
            last_heading = trim_trailing(node_text(node, source));
            continue;
        }

        bool in_container = item.in_container || language.is_container(type);

        if (!item.in_container && language.is_function(type) && !ts_node_has_error(node)) {
            // The span opens at the outermost wrapper, then grows over the
            // comments and attributes directly above it.
            TSNode span_node = node;
            for (TSNode parent = ts_node_parent(span_node);
                 !ts_node_is_null(parent) && language.is_wrapper(ts_node_type(parent));
                 parent = ts_node_parent(parent)) {
                span_node = parent;
            }

            uint32_t span_start = ts_node_start_byte(span_node);
            uint32_t span_row = ts_node_start_point(span_node).row;

            for (TSNode sib = ts_node_prev_sibling(span_node); !ts_node_is_null(sib);
                 sib = ts_node_prev_sibling(sib)) {
                const char* sib_type = ts_node_type(sib);
                if (!language.is_comment(sib_type) && !language.is_attribute(sib_type)) break;

                uint32_t sib_last = last_row(sib);
                uint32_t gap = span_row > sib_last ? span_row - sib_last - 1 : 0;
                if (gap > language.max_comment_gap) break;
                if (!starts_own_line(source, ts_node_start_byte(sib))) break;

                span_start = ts_node_start_byte(sib);
                span_row = ts_node_start_point(sib).row;
            }

            uint32_t end_byte = ts_node_end_byte(node);
            std::string_view captured = source.substr(span_start, end_byte - span_start);

            Chunk chunk;
            chunk.path = relative_path;
            chunk.start_line = ts_node_start_point(node).row + 1;
            chunk.end_line = last_row(node) + 1;
            chunk.language = language.name;
            chunk.function_name = extract_name(node, source);

            if (language.is_titled(type) && !last_heading.empty()) {
                std::string titled = last_heading + "\n" + std::string(captured);
                chunk.content_hash = xxhash64(titled);
                if (!hash_only) chunk.content = std::move(titled);
            } else {
                chunk.content_hash = xxhash64(captured);
                if (!hash_only) chunk.content = std::string(captured);
            }

            // Outer constructs are visited first, so they keep a shared key.
            if (seen.insert(chunk.key()).second) {
                found.push_back(std::move(chunk));
            }
        }

        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push({ts_node_child(node, i - 1), in_container});
        }
    }

    return found;
}

// --- DRIVER ---

namespace {

ChunkRun run_chunker(const fs::path& root, const ChunkOptions& options) {
    auto start = std::chrono::steady_clock::now();

    FileScanner scanner(root, options.filter);
    std::vector<ScannedFile> files = scanner.scan();

    ChunkRun run;
    run.files_scanned = files.size();

    // Results are stored per index so the merge keeps scan order.
    std::vector<std::vector<Chunk>> per_file(files.size());
    std::vector<std::optional<FileIssue>> per_file_issue(files.size());
    std::vector<char> chunked(files.size(), 0);

    int threads = options.threads > 0 ? options.threads : omp_get_max_threads();

    #pragma omp parallel num_threads(threads)
    {
        ChunkExtractor extractor;

        #pragma omp for schedule(dynamic, 4)
        for (int i = 0; i < static_cast<int>(files.size()); ++i) {
            const ScannedFile& file = files[i];
            try {
                std::string source;
                if (!read_source_file(file.absolute_path, options.filter.max_file_size, source)) continue;

                bool had_errors = false;
                per_file[i] = extractor.extract(file.relative_path, source, *file.language,
                                                options.hash_only, had_errors);
                chunked[i] = 1;
                if (had_errors) {
                    per_file_issue[i] = FileIssue{file.relative_path, FileIssue::Kind::Parse,
                                                  "syntax errors; affected constructs skipped"};
                }
            } catch (const ParseError& e) {
                per_file_issue[i] = FileIssue{file.relative_path, FileIssue::Kind::Parse, e.what()};
            } catch (const std::exception& e) {
                per_file_issue[i] = FileIssue{file.relative_path, FileIssue::Kind::IO, e.what()};
            }
        }
    }

    for (size_t i = 0; i < files.size(); ++i) {
        if (chunked[i]) run.files_chunked++;
        if (per_file_issue[i]) {
            spdlog::warn("⚠️ {} | {}: {}", per_file_issue[i]->kind == FileIssue::Kind::Parse ? "PARSE" : "IO   ",
                         per_file_issue[i]->path, per_file_issue[i]->message);
            run.issues.push_back(std::move(*per_file_issue[i]));
        }
        for (auto& chunk : per_file[i]) run.chunks.push_back(std::move(chunk));
    }

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("🛰️  Chunked {} of {} files into {} chunks in {:.1f} ms ({} issues)",
                 run.files_chunked, run.files_scanned, run.chunks.size(), ms, run.issues.size());
    return run;
}

} // namespace

ChunkRun chunk_files(const fs::path& root, const ChunkOptions& options) {
    return run_chunker(root, options);
}

ChunkRun hash_chunk_files(const fs::path& root, ChunkOptions options) {
    options.hash_only = true;
    return run_chunker(root, options);
}

} // namespace codesync
