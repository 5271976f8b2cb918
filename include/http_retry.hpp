#pragma once
#include <chrono>
#include <string>
#include <thread>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace codesync {

struct RetryPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds step_delay{1000};
};

// Re-issues the same request on 429 (quota) and 503 (overload), sleeping a
// little longer each time. Any other status, success included, is returned
// as is; transport errors are never retried here.
template <typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::string& service,
                                         const RetryPolicy& policy = RetryPolicy()) {
    cpr::Response r;
    for (int i = 0; i < policy.max_attempts; ++i) {
        r = request_factory();
        if (r.status_code == 429 || r.status_code == 503) {
            if (i + 1 == policy.max_attempts) break;
            spdlog::warn("⚠️ {} {} ({}). Cooling down (Attempt {}/{})...",
                         service, r.status_code, (r.status_code == 429 ? "Quota" : "Overload"),
                         i + 1, policy.max_attempts);
            std::this_thread::sleep_for(policy.base_delay + policy.step_delay * i);
            continue;
        }
        break;
    }
    return r;
}

// "HTTP 500: <body>" or the transport error message.
inline std::string describe_failure(const cpr::Response& r) {
    if (r.error) return "transport error: " + r.error.message;
    std::string body = r.text.size() > 512 ? r.text.substr(0, 512) + "..." : r.text;
    return "HTTP " + std::to_string(r.status_code) + ": " + body;
}

} // namespace codesync
