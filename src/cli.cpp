#include "cli.hpp"
#include <stdexcept>
#include <vector>

namespace codesync {

static const char* USAGE =
"usage:\n"
"  codesync chunk <path> [--hash-only]\n"
"  codesync sync <path> [--embedding-concurrency N] [--store-concurrency N]\n"
"  codesync search <query> [path] [-m N] [--scores] [--no-sync]\n"
"  codesync reset <path>\n"
"  codesync --chunk-only <path>\n"
"  codesync --sample N <path>\n"
"options:\n"
"  -v, --verbose                 debug logging (also CODESYNC_VERBOSE=1)\n"
"  -m, --max-count N             search hits to print (default 20)\n"
"  --scores                      print the distance of each hit\n"
"  --no-sync                     search without syncing the index first\n"
"  --sample N                    print N random chunks (seeded by the path)\n"
"  --embedding-concurrency N     embedding requests in flight (1-3)\n"
"  --store-concurrency N         store requests in flight (default 4)\n"
"  --hash-only                   chunk without keeping content\n";

const char* usage() { return USAGE; }

namespace {

int parse_positive(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != value.size() || n <= 0) throw std::invalid_argument(value);
        return n;
    } catch (const std::logic_error&) {
        throw UsageError("Expected a positive number after " + flag + ", got '" + value + "'");
    }
}

} // namespace

Args parse_cli(int argc, char** argv) {
    Args a;
    bool chunk_only = false;
    bool sample = false;
    std::vector<std::string> positional;

    int i = 1;
    while (i < argc) {
        std::string f = argv[i++];
        auto next = [&](std::string& dst) {
            if (i >= argc) throw UsageError("Missing value after " + f);
            dst = argv[i++];
        };

        if (f == "-h" || f == "--help") a.help = true;
        else if (f == "-v" || f == "--verbose") a.verbose = true;
        else if (f == "--scores") a.scores = true;
        else if (f == "--hash-only") a.hash_only = true;
        else if (f == "--chunk-only") chunk_only = true;
        else if (f == "--no-sync") a.no_sync = true;
        else if (f == "--sample") { std::string v; next(v); a.sample = parse_positive(f, v); sample = true; }
        else if (f == "-m" || f == "--max-count") { std::string v; next(v); a.max_count = parse_positive(f, v); }
        else if (f == "--embedding-concurrency") { std::string v; next(v); a.embedding_concurrency = parse_positive(f, v); }
        else if (f == "--store-concurrency") { std::string v; next(v); a.store_concurrency = parse_positive(f, v); }
        else if (f.size() > 1 && f[0] == '-') throw UsageError("Unknown flag: " + f);
        else positional.push_back(f);
    }
    if (a.help) return a;

    if (chunk_only && sample) throw UsageError("--chunk-only and --sample are exclusive");
    if (chunk_only || sample) {
        a.mode = chunk_only ? "chunk-only" : "sample";
        if (positional.size() > 1) throw UsageError("--" + a.mode + " takes a single path");
        if (!positional.empty()) a.path = positional[0];
        return a;
    }

    if (positional.empty()) throw UsageError("Missing command");
    a.mode = positional[0];

    if (a.mode == "chunk" || a.mode == "sync" || a.mode == "reset") {
        if (positional.size() > 2) throw UsageError(a.mode + " takes a single path");
        if (positional.size() == 2) a.path = positional[1];
    } else if (a.mode == "search") {
        if (positional.size() < 2) throw UsageError("search needs a query");
        if (positional.size() > 3) throw UsageError("search takes a query and an optional path");
        a.query = positional[1];
        if (positional.size() == 3) a.path = positional[2];
    } else {
        throw UsageError("Unknown command: " + a.mode);
    }
    return a;
}

} // namespace codesync
