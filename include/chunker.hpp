#pragma once
#include <tree_sitter/api.h>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "chunk.hpp"
#include "file_scanner.hpp"
#include "language_registry.hpp"

namespace codesync {

struct ChunkOptions {
    ProjectFilter filter;
    bool hash_only = false;
    int threads = 0; // 0 = OpenMP default
};

// A file that was skipped or only partly chunked.
struct FileIssue {
    enum class Kind { Parse, IO };

    std::string path;
    Kind kind = Kind::IO;
    std::string message;
};

struct ChunkRun {
    std::vector<Chunk> chunks;
    std::vector<FileIssue> issues;
    size_t files_scanned = 0;
    size_t files_chunked = 0;
};

// Owns one TSParser. Not thread-safe; use one per worker.
class ChunkExtractor {
public:
    ChunkExtractor();
    ~ChunkExtractor();

    ChunkExtractor(const ChunkExtractor&) = delete;
    ChunkExtractor& operator=(const ChunkExtractor&) = delete;

    // Throws ParseError when no tree can be produced. Constructs containing
    // syntax errors are left out; `had_errors` reports that the root had any.
    std::vector<Chunk> extract(const std::string& relative_path,
                               std::string_view source,
                               const LanguageSpec& language,
                               bool hash_only,
                               bool& had_errors);

private:
    TSParser* parser_;
};

// Reads the file as chunkable text. Returns false for files that are skipped
// silently (empty, too large, binary). Throws IOError on unreadable or
// non-UTF-8 files.
bool read_source_file(const std::filesystem::path& path, uint64_t max_file_size, std::string& out);

bool is_valid_utf8(std::string_view bytes);

ChunkRun chunk_files(const std::filesystem::path& root, const ChunkOptions& options = {});

// Same chunk keys and hashes as chunk_files, with content left empty.
ChunkRun hash_chunk_files(const std::filesystem::path& root, ChunkOptions options = {});

} // namespace codesync
