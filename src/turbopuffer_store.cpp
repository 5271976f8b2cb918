#include "turbopuffer_store.hpp"
#include "http_retry.hpp"
#include "settings.hpp"
#include "vector_codec.hpp"
#include <chrono>
#include <future>
#include <limits>
#include <spdlog/spdlog.h>

namespace codesync {

using json = nlohmann::json;

json to_upsert_row(const Chunk& chunk) {
    if (!chunk.vector) throw StoreError("chunk " + chunk.key().to_string() + " has no vector");
    json row = chunk.to_json();
    row["vector"] = encode_vector(*chunk.vector);
    return row;
}

std::vector<json> parse_query_rows(const std::string& body) {
    try {
        auto response_json = json::parse(body);
        const auto& rows_json = response_json.at("rows");
        if (!rows_json.is_array()) throw StoreError("turbopuffer response rows is not an array");
        std::vector<json> rows;
        rows.reserve(rows_json.size());
        for (const auto& row : rows_json) {
            if (!row.is_object() || !row.contains("id")) throw StoreError("turbopuffer row without an id");
            rows.push_back(row);
        }
        return rows;
    } catch (const json::exception& e) {
        throw StoreError(std::string("Malformed turbopuffer response: ") + e.what());
    }
}

void throw_turbopuffer_failure(const cpr::Response& r, const std::string& ns, const char* action) {
    if (r.error) {
        throw StoreError(std::string("turbopuffer ") + action + " failed: " + describe_failure(r));
    }
    bool missing = r.status_code == 404 ||
                   (r.text.find("namespace") != std::string::npos && r.text.find("not found") != std::string::npos);
    if (missing) {
        throw NamespaceNotFoundError("namespace " + ns + " not found", r.status_code);
    }
    throw StoreError(std::string("turbopuffer ") + action + " failed: " + describe_failure(r), r.status_code);
}

TurbopufferBackend::TurbopufferBackend(std::shared_ptr<KeyManager> key_manager, std::string region, long timeout_ms)
    : key_manager_(std::move(key_manager)), region_(std::move(region)), timeout_ms_(timeout_ms) {}

const std::vector<std::string>& TurbopufferBackend::regions() {
    static const std::vector<std::string> all = {
        "gcp-us-central1",
        "gcp-us-west1",
        "gcp-us-east4",
        "gcp-northamerica-northeast2",
        "gcp-europe-west3",
        "gcp-asia-southeast1",
        "aws-ap-southeast-2",
        "aws-eu-central-1",
        "aws-us-east-1",
        "aws-us-east-2",
        "aws-us-west-2",
    };
    return all;
}

std::string TurbopufferBackend::namespace_url(const std::string& ns) const {
    return "https://" + region_ + ".turbopuffer.com/v2/namespaces/" + ns;
}

cpr::Header TurbopufferBackend::headers() const {
    std::string api_key;
    try {
        api_key = key_manager_->require_turbopuffer_key();
    } catch (const ConfigError& e) {
        throw StoreError(e.what());
    }
    return cpr::Header{{"Content-Type", "application/json"}, {"Authorization", "Bearer " + api_key}};
}

void TurbopufferBackend::write(const std::string& ns,
                               const std::vector<Chunk>& upserts,
                               const std::vector<uint64_t>& delete_ids) {
    if (upserts.empty() && delete_ids.empty()) return;

    json request_body = json::object();
    if (!upserts.empty()) {
        json rows = json::array();
        for (const auto& chunk : upserts) rows.push_back(to_upsert_row(chunk));
        request_body["upsert_rows"] = std::move(rows);
        request_body["distance_metric"] = "cosine_distance";
        request_body["schema"] = {{"content_hash", "uint"}};
    }
    if (!delete_ids.empty()) request_body["deletes"] = delete_ids;

    std::string body = request_body.dump(-1, ' ', false, json::error_handler_t::replace);
    auto header = headers();
    auto start = std::chrono::high_resolution_clock::now();

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{namespace_url(ns)},
                         cpr::Body{body},
                         header,
                         cpr::Timeout{std::chrono::milliseconds(timeout_ms_)},
                         cpr::ConnectTimeout{10000});
    }, "turbopuffer");

    if (r.error || r.status_code != 200) throw_turbopuffer_failure(r, ns, "write");

    double ms = std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count();
    spdlog::debug("turbopuffer write {}: {} upserts, {} deletes in {:.1f} ms",
                  ns, upserts.size(), delete_ids.size(), ms);
}

std::vector<json> TurbopufferBackend::query(const std::string& ns, const StoreQuery& query) {
    json request_body = {
        {"rank_by", query.rank_by},
        {"top_k", query.top_k},
        {"exclude_attributes", json::array({"vector"})},
        {"consistency", {{"level", "eventual"}}}
    };
    if (query.filters) request_body["filters"] = *query.filters;

    std::string body = request_body.dump();
    auto header = headers();

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{namespace_url(ns) + "/query"},
                         cpr::Body{body},
                         header,
                         cpr::Timeout{std::chrono::milliseconds(timeout_ms_)},
                         cpr::ConnectTimeout{10000});
    }, "turbopuffer");

    if (r.error || r.status_code != 200) throw_turbopuffer_failure(r, ns, "query");

    return parse_query_rows(r.text);
}

void TurbopufferBackend::delete_namespace(const std::string& ns) {
    auto header = headers();
    auto r = perform_request_with_retry([&]() {
        return cpr::Delete(cpr::Url{namespace_url(ns)},
                           header,
                           cpr::Timeout{std::chrono::milliseconds(timeout_ms_)},
                           cpr::ConnectTimeout{10000});
    }, "turbopuffer");

    if (r.error || r.status_code < 200 || r.status_code >= 300) throw_turbopuffer_failure(r, ns, "delete");
}

std::optional<long> TurbopufferBackend::ping(const std::string& region) {
    auto start = std::chrono::steady_clock::now();
    auto r = cpr::Get(cpr::Url{"https://" + region + ".turbopuffer.com/"},
                      cpr::Timeout{5000},
                      cpr::ConnectTimeout{5000});
    if (r.error) {
        spdlog::debug("tpuf ping to {} failed: {}", region, r.error.message);
        return std::nullopt;
    }
    long ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
    spdlog::debug("tpuf ping to {} took {} ms", region, ms);
    return ms;
}

std::string TurbopufferBackend::find_closest_region() {
    std::vector<std::future<std::optional<long>>> pings;
    for (const auto& region : regions()) {
        pings.push_back(std::async(std::launch::async, [region]() { return ping(region); }));
    }

    std::string best_region = Settings::kDefaultRegion;
    long best_latency = std::numeric_limits<long>::max();
    for (size_t i = 0; i < pings.size(); ++i) {
        auto latency = pings[i].get();
        if (latency && *latency < best_latency) {
            best_latency = *latency;
            best_region = regions()[i];
        }
    }
    spdlog::info("🌍 Closest turbopuffer region: {}", best_region);
    return best_region;
}

} // namespace codesync
