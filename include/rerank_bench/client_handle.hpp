#pragma once

#include "rerank_bench/config.hpp"

#include <curl/curl.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace rerank_bench {

struct HttpResponse {
    long        status = 0;
    std::string body;
};

// Outcome of retiring a handle. Failures are reported, never thrown.
struct ReleaseResult {
    bool        ok = true;
    std::string message;

    static ReleaseResult Ok() { return {}; }
    static ReleaseResult Failure(std::string msg) { return {false, std::move(msg)}; }

    explicit operator bool() const noexcept { return ok; }
};

// A reusable connection to one scoring endpoint, bound to one ClientConfig.
class ClientHandle {
public:
    virtual ~ClientHandle() = default;

    virtual const ClientConfig& Config() const noexcept = 0;

    // POST `body` as JSON to Config().Endpoint() + path.
    // Throws TransportError when no HTTP response could be obtained.
    virtual HttpResponse Post(const std::string& path,
                              const std::string& body,
                              std::chrono::milliseconds timeout) = 0;

    // Closes the underlying connections. Safe to call more than once.
    virtual ReleaseResult Release() noexcept = 0;
};

// Builds a handle for a config. Throws ClientCreationError on failure.
using HandleFactory = std::function<std::unique_ptr<ClientHandle>(const ClientConfig&)>;

// libcurl easy handle; keeps its connection cache alive across calls.
// Post() is serialized internally, but a handle is meant to be used by one caller.
class HttpClient final : public ClientHandle {
public:
    explicit HttpClient(ClientConfig cfg);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    const ClientConfig& Config() const noexcept override { return cfg_; }

    HttpResponse Post(const std::string& path,
                      const std::string& body,
                      std::chrono::milliseconds timeout) override;

    ReleaseResult Release() noexcept override;

private:
    ClientConfig cfg_;
    std::mutex   mtx_;
    CURL*        curl_ = nullptr;
    curl_slist*  headers_ = nullptr;
};

std::unique_ptr<ClientHandle> MakeHttpClient(const ClientConfig& cfg);

}
