#include "sync_service.hpp"
#include "diff_engine.hpp"
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <spdlog/spdlog.h>

namespace codesync {

const char* to_string(SyncStage stage) {
    switch (stage) {
        case SyncStage::Start: return "START";
        case SyncStage::Chunking: return "CHUNKING";
        case SyncStage::RemoteFetch: return "REMOTE_FETCH";
        case SyncStage::Diffed: return "DIFFED";
        case SyncStage::Embedding: return "EMBEDDING";
        case SyncStage::Applying: return "APPLYING";
        case SyncStage::Done: return "DONE";
    }
    return "UNKNOWN";
}

SyncService::SyncService(EmbeddingService& embedding_service, VectorStoreClient& store)
    : embedding_service_(embedding_service), store_(store) {}

void SyncService::enter(SyncStage stage, const std::string& detail) const {
    if (detail.empty()) {
        spdlog::info("🚀 [{}]", to_string(stage));
    } else {
        spdlog::info("🚀 [{}] {}", to_string(stage), detail);
    }
}

SyncReport SyncService::perform_sync(const fs::path& root, const std::string& ns, const SyncOptions& options) {
    auto start = std::chrono::steady_clock::now();
    SyncReport report;
    enter(SyncStage::Start, root.string() + " -> " + ns);

    // PHASE 1: local chunking on the OpenMP pool while the listing downloads.
    enter(SyncStage::RemoteFetch, ns);
    auto remote_future = std::async(std::launch::async, [this, &ns]() {
        return store_.all_server_chunks(ns);
    });

    enter(SyncStage::Chunking);
    ChunkOptions chunk_options = options.chunk_options;
    chunk_options.hash_only = false;
    ChunkRun run = chunk_files(root, chunk_options);
    std::vector<Chunk> remote = remote_future.get();

    report.found = run.chunks.size();
    report.file_issues = std::move(run.issues);

    // PHASE 2: diff on keys and hashes only.
    DiffResult diff = diff_chunks(run.chunks, remote);
    run.chunks.clear();
    remote.clear();

    report.to_upsert = diff.to_upsert.size();
    report.to_delete = diff.to_delete.size();
    report.unchanged = diff.unchanged.size();
    report.changed = !diff.empty();
    enter(SyncStage::Diffed, std::to_string(report.to_upsert) + " to upsert, " +
                             std::to_string(report.to_delete) + " to delete, " +
                             std::to_string(report.unchanged) + " unchanged");

    // PHASE 3: producer -> embedder -> forwarder -> store, all bounded.
    Channel<Chunk> embed_input(options.channel_capacity);
    Channel<EmbeddedChunk> embedded(options.channel_capacity);
    Channel<Chunk> store_input(options.channel_capacity);

    std::set<std::string> failed_paths;
    std::set<std::string> embed_errors;

    enter(SyncStage::Embedding);
    std::thread producer([&embed_input, &diff]() {
        for (auto& chunk : diff.to_upsert) {
            if (!embed_input.push(std::move(chunk))) break;
        }
        embed_input.close();
    });

    auto embed_future = std::async(std::launch::async, [this, &embed_input, &embedded]() {
        embedding_service_.embed_stream(embed_input, embedded, EmbeddingType::Document);
    });

    // Only successfully embedded chunks reach the store; failed ones stay
    // stale remotely and are retried by the next pass.
    std::thread forwarder([&]() {
        while (auto item = embedded.pop()) {
            if (item->ok()) {
                report.embedded++;
                if (!store_input.push(std::move(item->chunk))) break;
            } else {
                report.embed_failed++;
                failed_paths.insert(item->chunk.path);
                embed_errors.insert(item->error->what());
            }
        }
        store_input.close();
    });

    enter(SyncStage::Applying);
    ApplySummary summary;
    try {
        summary = store_.apply_diff(ns, store_input, diff.to_delete);
    } catch (const std::exception& e) {
        spdlog::error("❌ Apply stage aborted: {}", e.what());
        embed_input.close();
        embedded.close();
        store_input.close();
        producer.join();
        forwarder.join();
        embed_future.wait();
        throw;
    }

    producer.join();
    forwarder.join();
    embed_future.get();

    report.upserted = summary.upserted;
    report.deleted = summary.deleted;
    report.upsert_failed = summary.failed(BatchFailure::Kind::Upsert);
    report.delete_failed = summary.failed(BatchFailure::Kind::Delete);
    for (const auto& failure : summary.failures) {
        failed_paths.insert(failure.paths.begin(), failure.paths.end());
        report.errors.push_back(std::string(failure.kind == BatchFailure::Kind::Delete ? "delete" : "upsert") +
                                " batch of " + std::to_string(failure.count) + ": " + failure.error);
    }
    for (const auto& error : embed_errors) report.errors.push_back("embedding: " + error);
    report.failed_paths.assign(failed_paths.begin(), failed_paths.end());

    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    enter(SyncStage::Done, fmt::format("{:.2f}s | found {} | upserted {} | deleted {} | failed {}", seconds,
                                       report.found, report.upserted, report.deleted,
                                       report.embed_failed + report.upsert_failed + report.delete_failed));
    if (!report.ok()) {
        spdlog::warn("⚠️ Sync finished with failures in {} files", report.failed_paths.size());
    }
    return report;
}

} // namespace codesync
