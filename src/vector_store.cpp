#include "vector_store.hpp"
#include "ThreadPool.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <limits>
#include <mutex>
#include <set>
#include <spdlog/spdlog.h>

namespace codesync {

using json = nlohmann::json;

namespace {

template <typename Items, typename PathOf>
std::vector<std::string> distinct_paths(const Items& items, PathOf path_of) {
    std::set<std::string> paths;
    for (const auto& item : items) paths.insert(path_of(item));
    return std::vector<std::string>(paths.begin(), paths.end());
}

} // namespace

size_t ApplySummary::failed(BatchFailure::Kind kind) const {
    size_t n = 0;
    for (const auto& f : failures) {
        if (f.kind == kind) n += f.count;
    }
    return n;
}

VectorStoreClient::VectorStoreClient(std::shared_ptr<VectorStoreBackend> backend, size_t concurrency)
    : backend_(std::move(backend)), concurrency_(std::max<size_t>(1, concurrency)) {}

ApplySummary VectorStoreClient::apply_diff(const std::string& ns, Channel<Chunk>& upserts,
                                           const std::vector<ChunkKey>& deletes) {
    auto start = std::chrono::steady_clock::now();
    ApplySummary summary;
    std::mutex summary_mutex;

    ThreadPool pool(concurrency_);
    InFlightLimiter limiter(concurrency_);
    std::vector<std::future<void>> pending;

    auto record_failure = [&](BatchFailure failure) {
        spdlog::warn("⚠️ Store {} batch of {} failed: {}",
                     failure.kind == BatchFailure::Kind::Delete ? "delete" : "upsert",
                     failure.count, failure.error);
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary.failures.push_back(std::move(failure));
    };

    auto dispatch_deletes = [&](std::vector<ChunkKey> batch) {
        limiter.acquire();
        pending.push_back(pool.enqueue([&, b = std::move(batch)]() {
            InFlightReleaser release(limiter);
            std::vector<uint64_t> ids;
            ids.reserve(b.size());
            for (const auto& key : b) ids.push_back(key.id());

            std::string error;
            try {
                backend_->write(ns, {}, ids);
                std::lock_guard<std::mutex> lock(summary_mutex);
                summary.deleted += b.size();
                return;
            } catch (const StoreError& e) {
                error = e.what();
            } catch (const std::exception& e) {
                error = std::string("unexpected: ") + e.what();
            }
            record_failure({BatchFailure::Kind::Delete, b.size(),
                            distinct_paths(b, [](const ChunkKey& k) { return k.path; }), error});
        }));
    };

    auto dispatch_upserts = [&](std::vector<Chunk> batch) {
        limiter.acquire();
        pending.push_back(pool.enqueue([&, b = std::move(batch)]() {
            InFlightReleaser release(limiter);
            std::string error;
            try {
                backend_->write(ns, b, {});
                std::lock_guard<std::mutex> lock(summary_mutex);
                summary.upserted += b.size();
                return;
            } catch (const StoreError& e) {
                error = e.what();
            } catch (const std::exception& e) {
                error = std::string("unexpected: ") + e.what();
            }
            record_failure({BatchFailure::Kind::Upsert, b.size(),
                            distinct_paths(b, [](const Chunk& c) { return c.path; }), error});
        }));
    };

    for (size_t i = 0; i < deletes.size(); i += kWriteBatchSize) {
        size_t end = std::min(i + kWriteBatchSize, deletes.size());
        dispatch_deletes(std::vector<ChunkKey>(deletes.begin() + i, deletes.begin() + end));
    }

    std::vector<Chunk> batch;
    std::vector<Chunk> unembedded;
    while (auto chunk = upserts.pop()) {
        if (!chunk->vector) {
            unembedded.push_back(std::move(*chunk));
            continue;
        }
        batch.push_back(std::move(*chunk));
        if (batch.size() == kWriteBatchSize) {
            dispatch_upserts(std::move(batch));
            batch = std::vector<Chunk>();
        }
    }
    if (!batch.empty()) dispatch_upserts(std::move(batch));

    if (!unembedded.empty()) {
        record_failure({BatchFailure::Kind::Upsert, unembedded.size(),
                        distinct_paths(unembedded, [](const Chunk& c) { return c.path; }),
                        "chunk has no vector"});
    }

    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (const std::exception& e) {
            spdlog::error("❌ Store worker crashed: {}", e.what());
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("📦 Applied to {}: {} upserted, {} deleted, {} failed batches in {:.1f} ms",
                 ns, summary.upserted, summary.deleted, summary.failures.size(), ms);
    return summary;
}

ApplySummary VectorStoreClient::apply_diff(const std::string& ns, std::vector<Chunk> upserts,
                                           const std::vector<ChunkKey>& deletes) {
    Channel<Chunk> channel(upserts.size() + 1);
    for (auto& chunk : upserts) channel.push(std::move(chunk));
    channel.close();
    return apply_diff(ns, channel, deletes);
}

std::vector<Chunk> VectorStoreClient::all_server_chunks(const std::string& ns) {
    std::vector<Chunk> chunks;
    std::optional<uint64_t> last_id;

    try {
        for (;;) {
            StoreQuery page;
            page.rank_by = json::array({"id", "asc"});
            page.top_k = kPageSize;
            if (last_id) page.filters = json::array({"id", "Gt", *last_id});

            auto rows = backend_->query(ns, page);
            for (const auto& row : rows) {
                chunks.push_back(Chunk::from_json(row));
            }
            if (!rows.empty()) last_id = rows.back().at("id").get<uint64_t>();
            if (rows.size() < kPageSize) break;
        }
    } catch (const NamespaceNotFoundError&) {
        spdlog::info("🆕 Namespace {} does not exist yet", ns);
        return {};
    } catch (const json::exception& e) {
        throw StoreError(std::string("Malformed listing row: ") + e.what());
    }

    spdlog::debug("Listed {} remote chunks from {}", chunks.size(), ns);
    return chunks;
}

std::vector<Chunk> VectorStoreClient::query(const std::string& ns, const std::vector<float>& vector,
                                            uint32_t top_k, const std::optional<json>& filters) {
    if (top_k == 0) return {};

    StoreQuery q;
    q.rank_by = json::array({"vector", "ANN", vector});
    q.top_k = top_k;
    q.filters = filters;

    std::vector<Chunk> results;
    for (const auto& row : backend_->query(ns, q)) {
        results.push_back(Chunk::from_json(row));
    }

    std::stable_sort(results.begin(), results.end(), [](const Chunk& a, const Chunk& b) {
        float da = a.distance.value_or(std::numeric_limits<float>::infinity());
        float db = b.distance.value_or(std::numeric_limits<float>::infinity());
        return da < db;
    });
    if (results.size() > top_k) results.resize(top_k);
    return results;
}

void VectorStoreClient::delete_namespace(const std::string& ns) {
    backend_->delete_namespace(ns);
    spdlog::info("🗑️  Namespace {} deleted", ns);
}

} // namespace codesync
