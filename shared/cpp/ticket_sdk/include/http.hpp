#pragma once
#include <atomic>
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Throws ConnectivityError on transport failure, timeout, or when `cancel`
// becomes true while the request is in flight.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000,
                            const std::atomic<bool>* cancel = nullptr);
