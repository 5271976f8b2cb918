#include "search_engine.hpp"
#include "errors.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <fstream>
#include <spdlog/spdlog.h>

namespace codesync {

namespace fs = std::filesystem;

std::optional<std::string> read_line_range(const fs::path& file, uint32_t start_line, uint32_t end_line) {
    std::ifstream f(file);
    if (!f.is_open() || start_line == 0 || end_line < start_line) return std::nullopt;

    std::string line;
    std::string out;
    uint32_t number = 0;
    bool any = false;
    while (std::getline(f, line)) {
        ++number;
        if (number < start_line) continue;
        if (number > end_line) break;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (any) out += '\n';
        out += line;
        any = true;
    }
    if (!any) return std::nullopt;
    return out;
}

namespace {

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

std::vector<Chunk> SearchEngine::search(const std::string& query, const fs::path& root,
                                        const std::string& ns, uint32_t max_count) {
    if (is_blank(query)) throw EmbeddingError("empty query");

    auto start = std::chrono::high_resolution_clock::now();
    std::vector<float> query_vector = embedding_service_.embed_query(query);
    auto embedded = std::chrono::high_resolution_clock::now();

    std::vector<Chunk> results = store_.query(ns, query_vector, max_count);
    auto queried = std::chrono::high_resolution_clock::now();

    for (auto& chunk : results) {
        chunk.content = read_line_range(root / chunk.path, chunk.start_line, chunk.end_line);
    }

    spdlog::debug("⏱️ Search: embed {:.1f} ms, query {:.1f} ms, {} hits",
                  std::chrono::duration<double, std::milli>(embedded - start).count(),
                  std::chrono::duration<double, std::milli>(queried - embedded).count(),
                  results.size());
    return results;
}

SyncedSearch search_with_sync(SearchEngine& engine, SyncService& sync,
                              const std::string& query, const fs::path& root,
                              const std::string& ns, uint32_t max_count,
                              const SyncOptions& options) {
    if (is_blank(query)) throw EmbeddingError("empty query");

    auto sync_future = std::async(std::launch::async, [&sync, &root, &ns, &options]() {
        return sync.perform_sync(root, ns, options);
    });

    SyncedSearch outcome;
    bool missing = false;
    std::exception_ptr search_error;
    try {
        outcome.results = engine.search(query, root, ns, max_count);
    } catch (const NamespaceNotFoundError&) {
        missing = true;
    } catch (const Error&) {
        search_error = std::current_exception();
    }

    try {
        outcome.report = sync_future.get();
    } catch (const std::exception& e) {
        if (search_error) std::rethrow_exception(search_error);
        if (missing) throw;
        spdlog::warn("⚠️ Sync failed, results come from the existing index: {}", e.what());
        outcome.sync_error = e.what();
        return outcome;
    }
    if (search_error) std::rethrow_exception(search_error);

    if (missing || outcome.report->changed) {
        spdlog::info("🔁 {}, searching again", missing ? "Index created" : "Index changed");
        outcome.results = engine.search(query, root, ns, max_count);
        outcome.requeried = true;
    }
    return outcome;
}

std::string SearchEngine::format_result(const Chunk& chunk, bool with_scores) {
    std::string preview = "[no content]";
    if (chunk.content) {
        std::string first = chunk.content->substr(0, chunk.content->find('\n'));
        size_t b = first.find_first_not_of(" \t\r");
        size_t e = first.find_last_not_of(" \t\r");
        preview = b == std::string::npos ? "" : first.substr(b, e - b + 1);
    }

    std::string prefix = chunk.path + ":" + std::to_string(chunk.start_line) + ":";
    if (!with_scores) return prefix + preview;
    if (chunk.distance) return prefix + fmt::format("{:.4f}", *chunk.distance) + ":" + preview;
    return prefix + "n/a:" + preview;
}

} // namespace codesync
