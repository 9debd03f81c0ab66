#include "../include/http.hpp"
#include "../include/errors.hpp"
#include <curl/curl.h>

// Owns the easy handle and header list for one request.
struct CurlRequest {
    CURL* handle{curl_easy_init()};
    curl_slist* headers{nullptr};

    ~CurlRequest() {
        if (headers) curl_slist_free_all(headers);
        if (handle) curl_easy_cleanup(handle);
    }
};

static size_t collect_body(void* data, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<const char*>(data), size * nmemb);
    return size * nmemb;
}

static int abort_on_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const std::atomic<bool>*>(clientp);
    return stop->load() ? 1 : 0;
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms,
                            const std::atomic<bool>* cancel) {
    CurlRequest req;
    if (!req.handle) throw ConnectivityError("curl_easy_init failed");
    req.headers = curl_slist_append(req.headers, "Content-Type: application/json");

    HttpResponse resp;
    CURL* h = req.handle;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, req.headers);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    if (cancel) {
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, abort_on_stop);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(cancel));
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc == CURLE_ABORTED_BY_CALLBACK) throw ConnectivityError("request to " + url + " cancelled");
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        throw ConnectivityError("request to " + url + " timed out after " + std::to_string(timeout_ms) + "ms");
    }
    if (rc != CURLE_OK) throw ConnectivityError("POST " + url + " failed: " + curl_easy_strerror(rc));

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}
