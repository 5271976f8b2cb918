#include "commands.hpp"
#include "chunker.hpp"
#include "errors.hpp"
#include "file_scanner.hpp"
#include "hasher.hpp"
#include "project.hpp"
#include "search_engine.hpp"
#include "turbopuffer_store.hpp"
#include <algorithm>
#include <chrono>
#include <ostream>
#include <random>
#include <spdlog/spdlog.h>

namespace codesync {

namespace fs = std::filesystem;

Runtime make_runtime(const Args& args, std::shared_ptr<KeyManager> keys) {
    Runtime rt;
    rt.root = find_project_root(validate_directory(args.path));

    // Credentials first: a missing key must fail before any request goes out.
    keys->require_voyage_key();
    keys->require_turbopuffer_key();

    rt.settings = Settings::load_or_init(Settings::config_path(), [] {
        return TurbopufferBackend::find_closest_region();
    });
    if (args.embedding_concurrency) rt.settings.embedding_concurrency = *args.embedding_concurrency;
    if (args.store_concurrency) rt.settings.store_concurrency = *args.store_concurrency;
    rt.settings.normalize();

    if (rt.settings.embedding_provider != "voyage") {
        throw ConfigError("Unsupported embedding provider: " + rt.settings.embedding_provider);
    }

    rt.embedding = std::make_unique<EmbeddingService>(
        std::make_shared<VoyageEmbeddingBackend>(keys, rt.settings.embedding_model, rt.settings.request_timeout_ms),
        rt.settings.embedding_concurrency);
    rt.store = std::make_unique<VectorStoreClient>(
        std::make_shared<TurbopufferBackend>(keys, rt.settings.turbopuffer_region, rt.settings.request_timeout_ms),
        rt.settings.store_concurrency);
    rt.ns = namespace_for(rt.root, rt.embedding->provider());

    spdlog::info("📂 Project {} | namespace {} | region {}", rt.root.string(), rt.ns,
                 rt.settings.turbopuffer_region);
    spdlog::debug("Concurrency: embedding {}, store {}", rt.embedding->concurrency(), rt.store->concurrency());
    return rt;
}

std::vector<Chunk> sample_chunks(std::vector<Chunk> chunks, size_t n, uint64_t seed) {
    if (chunks.size() <= n) return chunks;

    std::sort(chunks.begin(), chunks.end(), [](const Chunk& a, const Chunk& b) {
        if (a.path != b.path) return a.path < b.path;
        return a.start_line < b.start_line;
    });
    std::mt19937_64 rng(seed);
    std::shuffle(chunks.begin(), chunks.end(), rng);
    chunks.resize(n);
    return chunks;
}

namespace {

std::string first_line(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    size_t b = line.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = line.find_last_not_of(" \t\r");
    return line.substr(b, e - b + 1);
}

ChunkOptions chunk_options_for(const fs::path& path, bool hash_only) {
    if (!fs::exists(path)) throw IOError("Path does not exist: " + path.string());
    ChunkOptions options;
    options.hash_only = hash_only;
    options.filter = FileScanner::load_config(fs::is_directory(path) ? path : path.parent_path());
    return options;
}

} // namespace

int cmd_chunk(const Args& args, std::ostream& out) {
    fs::path path(args.path);
    ChunkOptions options = chunk_options_for(path, args.hash_only);
    ChunkRun run = args.hash_only ? hash_chunk_files(path, options) : chunk_files(path, options);

    for (const auto& chunk : run.chunks) {
        out << chunk.path << ":" << chunk.start_line << "-" << chunk.end_line << " "
            << (chunk.content ? first_line(*chunk.content) : std::string("[hash-only]")) << "\n";
    }
    if (run.chunks.empty()) {
        spdlog::warn("⚠️ No chunks found under {}", path.string());
        return kExitUsage;
    }
    return kExitOk;
}

int cmd_chunk_only(const Args& args, std::ostream& out) {
    fs::path path(args.path);
    ChunkOptions options = chunk_options_for(path, true);

    auto start = std::chrono::high_resolution_clock::now();
    ChunkRun run = hash_chunk_files(path, options);
    double ms = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();

    out << "files scanned: " << run.files_scanned << "\n"
        << "files chunked: " << run.files_chunked << "\n"
        << "chunks: " << run.chunks.size() << "\n"
        << "issues: " << run.issues.size() << "\n"
        << fmt::format("time: {:.1f} ms", ms) << "\n";
    for (const auto& issue : run.issues) spdlog::warn("⚠️ Skipped {}: {}", issue.path, issue.message);
    return run.issues.empty() ? kExitOk : kExitFailures;
}

int cmd_sample(const Args& args, std::ostream& out) {
    fs::path root = find_project_root(validate_directory(args.path));
    ChunkOptions options = chunk_options_for(root, false);
    ChunkRun run = chunk_files(root, options);

    auto sampled = sample_chunks(std::move(run.chunks), args.sample, xxhash64(args.path));
    for (const auto& chunk : sampled) {
        if (!chunk.content) continue;
        out << chunk.path << ":" << chunk.start_line << ":" << chunk.end_line << "\n"
            << *chunk.content << "\n\n";
    }
    return sampled.empty() ? kExitUsage : kExitOk;
}

int print_report(const SyncReport& report, std::ostream& out) {
    out << "found: " << report.found << "\n"
        << "to upsert: " << report.to_upsert << "\n"
        << "to delete: " << report.to_delete << "\n"
        << "unchanged: " << report.unchanged << "\n"
        << "upserted: " << report.upserted << "\n"
        << "deleted: " << report.deleted << "\n";

    for (const auto& issue : report.file_issues) {
        spdlog::warn("⚠️ Skipped {}: {}", issue.path, issue.message);
    }
    if (report.ok()) return kExitOk;

    out << "failed: " << (report.embed_failed + report.upsert_failed + report.delete_failed) << "\n";
    for (const auto& path : report.failed_paths) out << "  " << path << "\n";
    for (const auto& error : report.errors) spdlog::error("❌ {}", error);
    return kExitFailures;
}

int cmd_sync(Runtime& rt, bool reset, std::ostream& out) {
    if (reset) {
        try {
            rt.store->delete_namespace(rt.ns);
            spdlog::info("🧹 Deleted namespace {}", rt.ns);
        } catch (const NamespaceNotFoundError&) {
            spdlog::info("Namespace {} did not exist, nothing to reset", rt.ns);
        }
    }

    SyncOptions options;
    options.chunk_options.filter = FileScanner::load_config(rt.root);
    SyncReport report = SyncService(*rt.embedding, *rt.store).perform_sync(rt.root, rt.ns, options);
    return print_report(report, out);
}

int cmd_search(const Args& args, Runtime& rt, std::ostream& out) {
    SearchEngine engine(*rt.embedding, *rt.store);

    std::vector<Chunk> results;
    if (args.no_sync) {
        try {
            results = engine.search(args.query, rt.root, rt.ns, args.max_count);
        } catch (const NamespaceNotFoundError&) {
            spdlog::error("❌ {} has not been indexed yet, run `codesync sync {}` first", rt.root.string(),
                          rt.root.string());
            return kExitUsage;
        }
    } else {
        SyncOptions options;
        options.chunk_options.filter = FileScanner::load_config(rt.root);
        SyncService sync(*rt.embedding, *rt.store);
        SyncedSearch outcome = search_with_sync(engine, sync, args.query, rt.root, rt.ns, args.max_count, options);
        if (outcome.report && !outcome.report->ok()) {
            size_t failed = outcome.report->embed_failed + outcome.report->upsert_failed +
                            outcome.report->delete_failed;
            spdlog::warn("⚠️ {} chunks failed to sync; they are retried on the next run", failed);
        }
        results = std::move(outcome.results);
    }

    for (const auto& chunk : results) {
        out << SearchEngine::format_result(chunk, args.scores) << "\n";
    }
    return results.empty() ? kExitUsage : kExitOk;
}

int run_command(const Args& args, const RuntimeFactory& make, std::ostream& out) {
    try {
        if (args.mode == "chunk") return cmd_chunk(args, out);
        if (args.mode == "chunk-only") return cmd_chunk_only(args, out);
        if (args.mode == "sample") return cmd_sample(args, out);
        if (args.mode == "sync" || args.mode == "reset") {
            Runtime rt = make(args);
            return cmd_sync(rt, args.mode == "reset", out);
        }
        if (args.mode == "search") {
            Runtime rt = make(args);
            return cmd_search(args, rt, out);
        }
    } catch (const ConfigError& e) {
        spdlog::error("❌ Configuration error: {}", e.what());
        return kExitConfig;
    } catch (const UsageError& e) {
        spdlog::error("❌ {}", e.what());
        return kExitUsage;
    } catch (const IOError& e) {
        spdlog::error("❌ {}", e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("❌ {} failed: {}", args.mode, e.what());
        return kExitFailures;
    }

    spdlog::error("❌ Unknown command: {}", args.mode);
    return kExitUsage;
}

} // namespace codesync
