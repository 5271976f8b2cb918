#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cpr/cpr.h>
#include "Channel.hpp"
#include "KeyManager.hpp"
#include "chunk.hpp"
#include "errors.hpp"

namespace codesync {

// Tells the model whether the text is stored content or a search query.
enum class EmbeddingType { Document, Query };

const char* to_string(EmbeddingType type);

class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;

    // One vector per text, in input order. Throws EmbeddingError.
    virtual std::vector<std::vector<float>> embed_texts(const std::vector<std::string>& texts,
                                                        EmbeddingType type) = 0;

    virtual size_t max_batch_size() const { return 100; }
    virtual std::string provider() const = 0;
};

// Vectors from a Voyage /v1/embeddings response body, placed by data[].index.
// Embeddings may be float arrays or base64 little-endian f32. Throws
// EmbeddingError on malformed JSON, a count mismatch, a duplicate or
// out-of-range index, or an empty embedding.
std::vector<std::vector<float>> parse_voyage_embeddings(const std::string& body, size_t count);

// Voyage rejects a request whose texts together exceed the model's token budget.
bool is_batch_token_limit(const std::string& body);

// Voyage AI /v1/embeddings over cpr.
class VoyageEmbeddingBackend : public EmbeddingBackend {
public:
    // Sends one JSON body with the bearer key and returns the raw response.
    using Transport = std::function<cpr::Response(const std::string& body, const std::string& api_key)>;

    VoyageEmbeddingBackend(std::shared_ptr<KeyManager> key_manager,
                           std::string model = "voyage-code-3",
                           long timeout_ms = 60000,
                           Transport transport = nullptr);

    std::vector<std::vector<float>> embed_texts(const std::vector<std::string>& texts,
                                                EmbeddingType type) override;
    std::string provider() const override { return "voyage"; }

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::string model_;
    long timeout_ms_;
    Transport transport_;
    const std::string endpoint_ = "https://api.voyageai.com/v1/embeddings";

    cpr::Response post(const std::string& body, const std::string& api_key) const;

    // Splits [begin, end) in half while the service rejects it for size.
    std::vector<std::vector<float>> embed_range(const std::vector<std::string>& texts,
                                                size_t begin, size_t end,
                                                EmbeddingType type, const std::string& api_key);
};

// A chunk after embedding: vector filled, or the error of its batch.
struct EmbeddedChunk {
    Chunk chunk;
    std::optional<EmbeddingError> error;

    bool ok() const { return !error.has_value(); }
};

class EmbeddingService {
public:
    static constexpr size_t kMaxBatchSize = 100;
    static constexpr size_t kDefaultConcurrency = 3;

    explicit EmbeddingService(std::shared_ptr<EmbeddingBackend> backend,
                              size_t concurrency = kDefaultConcurrency);

    // Consumes `input` until it is closed; every chunk shows up exactly once
    // on `output`, which is closed on return. Order is not preserved.
    void embed_stream(Channel<Chunk>& input, Channel<EmbeddedChunk>& output,
                      EmbeddingType type = EmbeddingType::Document);

    std::vector<EmbeddedChunk> embed_all(std::vector<Chunk> chunks,
                                         EmbeddingType type = EmbeddingType::Document);

    // Throws EmbeddingError.
    std::vector<float> embed_query(const std::string& text);

    size_t concurrency() const { return concurrency_; }
    std::string provider() const { return backend_->provider(); }

private:
    std::shared_ptr<EmbeddingBackend> backend_;
    size_t batch_size_;
    size_t concurrency_;

    void embed_batch(std::vector<Chunk> batch, EmbeddingType type, Channel<EmbeddedChunk>& output);
};

} // namespace codesync
