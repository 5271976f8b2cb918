#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "errors.hpp"

namespace codesync {

// Bad command line. Exit code 1.
class UsageError : public Error {
public:
    using Error::Error;
};

struct Args {
    std::string mode;              // chunk | sync | search | reset | chunk-only | sample
    std::string path = ".";
    std::string query;
    bool verbose = false;
    bool scores = false;
    bool hash_only = false;
    bool help = false;
    bool no_sync = false;          // search the existing index only
    uint32_t max_count = 20;
    uint32_t sample = 0;           // chunks to print in sample mode
    std::optional<int> embedding_concurrency;
    std::optional<int> store_concurrency;
};

const char* usage();

// Throws UsageError.
Args parse_cli(int argc, char** argv);

} // namespace codesync
