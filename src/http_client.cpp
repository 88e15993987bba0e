#include "rerank_bench/client_handle.hpp"
#include "rerank_bench/errors.hpp"
#include "rerank_bench/logger.hpp"

#include <fmt/format.h>

namespace rerank_bench {

namespace {

// curl_global_init is not thread-safe on older libcurl; run it exactly once.
void EnsureCurlGlobalInit() {
    static const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw ClientCreationError(fmt::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
    }
}

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

}

HttpClient::HttpClient(ClientConfig cfg)
    : cfg_(std::move(cfg)) {
    EnsureCurlGlobalInit();
    curl_ = curl_easy_init();
    if (curl_ == nullptr) {
        throw ClientCreationError(fmt::format("curl_easy_init failed for {}", cfg_.Endpoint()));
    }
    headers_ = curl_slist_append(nullptr, "Content-Type: application/json");
    headers_ = curl_slist_append(headers_, "Accept: application/json");
    if (headers_ == nullptr) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        throw ClientCreationError("curl_slist_append failed");
    }
    RB_LOG_DEBUG("http client created for {} (timeout {}ms)", cfg_.Endpoint(), cfg_.Timeout().count());
}

HttpClient::~HttpClient() {
    auto r = Release();
    if (!r) {
        RB_LOG_WARN("http client release failed: {}", r.message);
    }
}

HttpResponse HttpClient::Post(const std::string& path,
                              const std::string& body,
                              std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string url = cfg_.Endpoint() + path;
    if (curl_ == nullptr) {
        throw TransportError(fmt::format("POST {}: client already released", url));
    }

    HttpResponse resp;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &WriteBody);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf);

    const CURLcode rc = curl_easy_perform(curl_);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, nullptr);
    if (rc != CURLE_OK) {
        throw TransportError(fmt::format("POST {}: {}{}{}", url, curl_easy_strerror(rc),
                                         errbuf[0] != '\0' ? " - " : "", errbuf));
    }
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status);
    RB_LOG_TRACE("POST {} -> {} ({} bytes)", url, resp.status, resp.body.size());
    return resp;
}

ReleaseResult HttpClient::Release() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    if (curl_ != nullptr) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    if (headers_ != nullptr) {
        curl_slist_free_all(headers_);
        headers_ = nullptr;
    }
    return ReleaseResult::Ok();
}

std::unique_ptr<ClientHandle> MakeHttpClient(const ClientConfig& cfg) {
    return std::make_unique<HttpClient>(cfg);
}

}
