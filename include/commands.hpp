#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include "KeyManager.hpp"
#include "cli.hpp"
#include "embedding_service.hpp"
#include "settings.hpp"
#include "sync_service.hpp"
#include "vector_store.hpp"

namespace codesync {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailures = 2;
constexpr int kExitConfig = 3;

// Everything the network commands share.
struct Runtime {
    std::filesystem::path root;
    std::string ns;
    Settings settings;
    std::unique_ptr<EmbeddingService> embedding;
    std::unique_ptr<VectorStoreClient> store;
};

// Resolves the project root and builds the Voyage and turbopuffer clients.
// Throws ConfigError before any request when a key is missing or the
// provider is unknown.
Runtime make_runtime(const Args& args, std::shared_ptr<KeyManager> keys);

using RuntimeFactory = std::function<Runtime(const Args&)>;

// `n` chunks in a seeded shuffle of (path, start_line) order; all of them
// when there are no more than `n`.
std::vector<Chunk> sample_chunks(std::vector<Chunk> chunks, size_t n, uint64_t seed);

int cmd_chunk(const Args& args, std::ostream& out);
int cmd_chunk_only(const Args& args, std::ostream& out);
int cmd_sample(const Args& args, std::ostream& out);
int cmd_sync(Runtime& rt, bool reset, std::ostream& out);
int cmd_search(const Args& args, Runtime& rt, std::ostream& out);

// Counts to `out`; kExitFailures when any batch failed.
int print_report(const SyncReport& report, std::ostream& out);

// Dispatches args.mode. The runtime is only built for network commands.
// Exceptions map to exit codes: ConfigError 3, UsageError and IOError 1,
// anything else 2.
int run_command(const Args& args, const RuntimeFactory& make, std::ostream& out);

} // namespace codesync
