#include "embedding_service.hpp"
#include "ThreadPool.hpp"
#include "http_retry.hpp"
#include "vector_codec.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <future>
#include <stdexcept>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace codesync {

using json = nlohmann::json;

const char* to_string(EmbeddingType type) {
    return type == EmbeddingType::Query ? "query" : "document";
}

// --- VOYAGE WIRE FORMAT ---

std::vector<std::vector<float>> parse_voyage_embeddings(const std::string& body, size_t count) {
    std::vector<std::vector<float>> vectors(count);
    try {
        auto response_json = json::parse(body);
        const auto& data = response_json.at("data");
        if (!data.is_array() || data.size() != count) {
            throw EmbeddingError("Voyage returned " + std::to_string(data.is_array() ? data.size() : 0) +
                                 " embeddings for " + std::to_string(count) + " inputs");
        }
        for (const auto& item : data) {
            size_t index = item.at("index").get<size_t>();
            if (index >= count || !vectors[index].empty()) {
                throw EmbeddingError("Voyage returned a bad embedding index " + std::to_string(index));
            }
            const auto& embedding = item.at("embedding");
            if (embedding.is_string()) {
                vectors[index] = decode_vector(embedding.get<std::string>());
            } else {
                vectors[index] = embedding.get<std::vector<float>>();
            }
            if (vectors[index].empty()) {
                throw EmbeddingError("Voyage returned an empty embedding at " + std::to_string(index));
            }
        }
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("Malformed Voyage response: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw EmbeddingError(std::string("Malformed Voyage embedding: ") + e.what());
    }
    return vectors;
}

bool is_batch_token_limit(const std::string& body) {
    std::string lowered = body;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("max allowed tokens per submitted batch") != std::string::npos;
}

// --- VOYAGE BACKEND ---

VoyageEmbeddingBackend::VoyageEmbeddingBackend(std::shared_ptr<KeyManager> key_manager,
                                               std::string model, long timeout_ms, Transport transport)
    : key_manager_(std::move(key_manager)), model_(std::move(model)), timeout_ms_(timeout_ms),
      transport_(std::move(transport)) {}

std::vector<std::vector<float>> VoyageEmbeddingBackend::embed_texts(
    const std::vector<std::string>& texts, EmbeddingType type) {
    if (texts.empty()) return {};
    std::string api_key;
    try {
        api_key = key_manager_->require_voyage_key();
    } catch (const ConfigError& e) {
        throw EmbeddingError(e.what());
    }
    return embed_range(texts, 0, texts.size(), type, api_key);
}

cpr::Response VoyageEmbeddingBackend::post(const std::string& body, const std::string& api_key) const {
    if (transport_) return transport_(body, api_key);
    return cpr::Post(cpr::Url{endpoint_},
                     cpr::Body{body},
                     cpr::Header{{"Content-Type", "application/json"},
                                 {"Authorization", "Bearer " + api_key}},
                     cpr::Timeout{std::chrono::milliseconds(timeout_ms_)},
                     cpr::ConnectTimeout{10000});
}

std::vector<std::vector<float>> VoyageEmbeddingBackend::embed_range(
    const std::vector<std::string>& texts, size_t begin, size_t end,
    EmbeddingType type, const std::string& api_key) {
    auto start = std::chrono::high_resolution_clock::now();
    const size_t count = end - begin;

    json payload = {
        {"input", std::vector<std::string>(texts.begin() + begin, texts.begin() + end)},
        {"model", model_},
        {"input_type", to_string(type)},
        {"output_dtype", "float"},
        {"encoding_format", "base64"}
    };
    std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() { return post(body, api_key); }, "Voyage");

    if (r.error) {
        throw EmbeddingError("Voyage request failed: " + describe_failure(r));
    }

    if (r.status_code != 200) {
        if (count > 1 && is_batch_token_limit(r.text)) {
            size_t mid = begin + count / 2;
            spdlog::debug("Voyage batch of {} over token limit, splitting", count);
            auto left = embed_range(texts, begin, mid, type, api_key);
            auto right = embed_range(texts, mid, end, type, api_key);
            left.insert(left.end(), std::make_move_iterator(right.begin()), std::make_move_iterator(right.end()));
            return left;
        }
        throw EmbeddingError("Voyage API error: " + describe_failure(r));
    }

    auto vectors = parse_voyage_embeddings(r.text, count);

    double ms = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();
    spdlog::debug("Voyage embedded {} texts in {:.1f} ms", count, ms);
    return vectors;
}

// --- EMBEDDING SERVICE ---

EmbeddingService::EmbeddingService(std::shared_ptr<EmbeddingBackend> backend, size_t concurrency)
    : backend_(std::move(backend)),
      batch_size_(std::max<size_t>(1, std::min(kMaxBatchSize, backend_->max_batch_size()))),
      concurrency_(std::clamp<size_t>(concurrency, 1, kDefaultConcurrency)) {}

void EmbeddingService::embed_batch(std::vector<Chunk> batch, EmbeddingType type,
                                   Channel<EmbeddedChunk>& output) {
    std::vector<std::string> texts;
    std::vector<Chunk> sendable;
    texts.reserve(batch.size());
    sendable.reserve(batch.size());

    for (auto& chunk : batch) {
        if (!chunk.content) {
            EmbeddingError error("chunk has no content: " + chunk.key().to_string());
            output.push(EmbeddedChunk{std::move(chunk), error});
            continue;
        }
        texts.push_back(*chunk.content);
        sendable.push_back(std::move(chunk));
    }
    if (sendable.empty()) return;

    std::optional<EmbeddingError> failure;
    std::vector<std::vector<float>> vectors;
    try {
        vectors = backend_->embed_texts(texts, type);
        if (vectors.size() != sendable.size()) {
            throw EmbeddingError("backend returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(sendable.size()) + " inputs");
        }
    } catch (const EmbeddingError& e) {
        failure = e;
    } catch (const std::exception& e) {
        failure = EmbeddingError(e.what());
    }

    if (failure) {
        spdlog::warn("⚠️ Embedding batch of {} failed: {}", sendable.size(), failure->what());
        for (auto& chunk : sendable) output.push(EmbeddedChunk{std::move(chunk), failure});
        return;
    }

    for (size_t i = 0; i < sendable.size(); ++i) {
        sendable[i].vector = std::move(vectors[i]);
        output.push(EmbeddedChunk{std::move(sendable[i]), std::nullopt});
    }
}

void EmbeddingService::embed_stream(Channel<Chunk>& input, Channel<EmbeddedChunk>& output,
                                    EmbeddingType type) {
    ThreadPool pool(concurrency_);
    InFlightLimiter limiter(concurrency_);
    std::vector<std::future<void>> pending;
    size_t batches = 0;

    auto dispatch = [&](std::vector<Chunk> batch) {
        limiter.acquire();
        ++batches;
        pending.push_back(pool.enqueue([this, &limiter, &output, type, b = std::move(batch)]() mutable {
            InFlightReleaser release(limiter);
            embed_batch(std::move(b), type, output);
        }));
    };

    std::vector<Chunk> batch;
    batch.reserve(batch_size_);
    while (auto chunk = input.pop()) {
        batch.push_back(std::move(*chunk));
        if (batch.size() == batch_size_) {
            dispatch(std::move(batch));
            batch = std::vector<Chunk>();
            batch.reserve(batch_size_);
        }
    }
    if (!batch.empty()) dispatch(std::move(batch));

    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (const std::exception& e) {
            spdlog::error("❌ Embedding worker crashed: {}", e.what());
            if (!first_error) first_error = std::current_exception();
        }
    }
    spdlog::debug("Embedding stream done: {} batches", batches);
    output.close();
    if (first_error) std::rethrow_exception(first_error);
}

std::vector<EmbeddedChunk> EmbeddingService::embed_all(std::vector<Chunk> chunks, EmbeddingType type) {
    Channel<Chunk> input(chunks.size() + 1);
    Channel<EmbeddedChunk> output(chunks.size() + 1);
    for (auto& chunk : chunks) input.push(std::move(chunk));
    input.close();

    embed_stream(input, output, type);

    std::vector<EmbeddedChunk> results;
    results.reserve(chunks.size());
    while (auto item = output.pop()) results.push_back(std::move(*item));
    return results;
}

std::vector<float> EmbeddingService::embed_query(const std::string& text) {
    if (text.empty()) throw EmbeddingError("empty query");

    auto vectors = backend_->embed_texts({text}, EmbeddingType::Query);
    if (vectors.size() != 1 || vectors[0].empty()) {
        throw EmbeddingError("backend returned no vector for the query");
    }
    return std::move(vectors[0]);
}

} // namespace codesync
