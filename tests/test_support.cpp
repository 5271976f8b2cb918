#include "test_support.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <random>
#include <thread>

namespace codesync::testing {

using json = nlohmann::json;

// ============================================================================
// TempDir
// ============================================================================

TempDir::TempDir() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (;;) {
        path_ = fs::temp_directory_path() / ("codesync_test_" + to_hex(gen()));
        if (fs::create_directories(path_)) break;
    }
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TempDir::write(const std::string& relative, const std::string& content) const {
    fs::path file = path_ / relative;
    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
    return file;
}

fs::path TempDir::mkdir(const std::string& relative) const {
    fs::path dir = path_ / relative;
    fs::create_directories(dir);
    return dir;
}

void PeakCounter::enter() {
    size_t now = ++current_;
    size_t seen = peak_.load();
    while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
    }
}

namespace {

// Leaves the counter on scope exit.
struct Occupy {
    explicit Occupy(PeakCounter& c) : counter(c) { counter.enter(); }
    ~Occupy() { counter.leave(); }
    PeakCounter& counter;
};

float cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
    double dot = 0, na = 0, nb = 0;
    for (size_t i = 0; i < std::min(a.size(), b.size()); ++i) {
        dot += a[i] * b[i];
        na += a[i] * a[i];
        nb += b[i] * b[i];
    }
    if (na == 0 || nb == 0) return 1.0f;
    return static_cast<float>(1.0 - dot / (std::sqrt(na) * std::sqrt(nb)));
}

} // namespace

// ============================================================================
// FakeEmbeddingBackend
// ============================================================================

std::vector<float> FakeEmbeddingBackend::vector_for(const std::string& text) {
    std::vector<float> v(kDimensions);
    for (size_t i = 0; i < kDimensions; ++i) {
        v[i] = static_cast<float>(xxhash64(text, i) % 1000) / 1000.0f + 0.001f;
    }
    return v;
}

std::vector<std::vector<float>> FakeEmbeddingBackend::embed_texts(const std::vector<std::string>& texts,
                                                                  EmbeddingType type) {
    Occupy occupy(in_flight_);
    std::string marker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch_sizes_.push_back(texts.size());
        last_type_ = type;
        marker = fail_marker_;
    }
    if (delay_.count() > 0) std::this_thread::sleep_for(delay_);

    if (!marker.empty()) {
        for (const auto& text : texts) {
            if (text.find(marker) != std::string::npos) {
                throw EmbeddingError("fake backend rejected batch containing " + marker);
            }
        }
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(texts.size());
    for (const auto& text : texts) vectors.push_back(vector_for(text));
    return vectors;
}

void FakeEmbeddingBackend::fail_when_contains(std::string marker) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_marker_ = std::move(marker);
}

std::vector<size_t> FakeEmbeddingBackend::batch_sizes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batch_sizes_;
}

size_t FakeEmbeddingBackend::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batch_sizes_.size();
}

EmbeddingType FakeEmbeddingBackend::last_type() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_type_;
}

// ============================================================================
// FakeVectorStore
// ============================================================================

void FakeVectorStore::write(const std::string& ns,
                            const std::vector<Chunk>& upserts,
                            const std::vector<uint64_t>& delete_ids) {
    Occupy occupy(in_flight_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        write_sizes_.push_back(upserts.size() + delete_ids.size());
        if (fail_writes_) throw StoreError("fake store rejected the write", 500);
    }
    if (delay_.count() > 0) std::this_thread::sleep_for(delay_);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& rows = namespaces_[ns];
    for (uint64_t id : delete_ids) rows.erase(id);
    for (const auto& chunk : upserts) {
        if (!chunk.vector) throw StoreError("upsert row without vector", 400);
        rows[chunk.id()] = chunk.to_json();
    }
}

std::vector<json> FakeVectorStore::query(const std::string& ns, const StoreQuery& q) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++query_calls_;
    if (fail_queries_) throw StoreError("fake store is unavailable", 503);

    auto found = namespaces_.find(ns);
    if (found == namespaces_.end()) throw NamespaceNotFoundError("namespace " + ns + " not found", 404);

    std::vector<json> rows;
    if (q.rank_by.at(0) == "id") {
        uint64_t after = 0;
        bool filtered = q.filters && q.filters->at(1) == "Gt";
        if (filtered) after = q.filters->at(2).get<uint64_t>();
        for (const auto& [id, row] : found->second) {
            if (filtered && id <= after) continue;
            json out = row;
            out.erase("vector");
            rows.push_back(std::move(out));
            if (rows.size() == q.top_k) break;
        }
        return rows;
    }

    std::vector<float> target = q.rank_by.at(2).get<std::vector<float>>();
    for (const auto& [id, row] : found->second) {
        json out = row;
        out["$dist"] = cosine_distance(row.at("vector").get<std::vector<float>>(), target);
        out.erase("vector");
        rows.push_back(std::move(out));
    }
    std::sort(rows.begin(), rows.end(), [](const json& a, const json& b) {
        return a.at("$dist").get<float>() < b.at("$dist").get<float>();
    });
    if (rows.size() > q.top_k) rows.resize(q.top_k);
    return rows;
}

void FakeVectorStore::delete_namespace(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (namespaces_.erase(ns) == 0) throw NamespaceNotFoundError("namespace " + ns + " not found", 404);
}

void FakeVectorStore::put(const std::string& ns, const Chunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    namespaces_[ns][chunk.id()] = chunk.to_json();
}

size_t FakeVectorStore::size(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = namespaces_.find(ns);
    return it == namespaces_.end() ? 0 : it->second.size();
}

bool FakeVectorStore::has(const std::string& ns, uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = namespaces_.find(ns);
    return it != namespaces_.end() && it->second.count(id) > 0;
}

bool FakeVectorStore::has_namespace(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return namespaces_.count(ns) > 0;
}

std::vector<Chunk> FakeVectorStore::records(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Chunk> out;
    auto it = namespaces_.find(ns);
    if (it == namespaces_.end()) return out;
    for (const auto& [id, row] : it->second) out.push_back(Chunk::from_json(row));
    return out;
}

std::vector<size_t> FakeVectorStore::write_sizes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_sizes_;
}

size_t FakeVectorStore::query_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_calls_;
}

void FakeVectorStore::fail_writes(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
}

void FakeVectorStore::fail_queries(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_queries_ = fail;
}

Chunk make_chunk(const std::string& path, uint32_t start, uint32_t end,
                 const std::string& content, uint64_t content_hash) {
    Chunk chunk;
    chunk.path = path;
    chunk.start_line = start;
    chunk.end_line = end;
    chunk.language = "rust";
    chunk.content = content;
    chunk.content_hash = content_hash;
    return chunk;
}

} // namespace codesync::testing
