#pragma once

#include "rerank_bench/client_handle.hpp"
#include "rerank_bench/config.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace rerank_bench {

/*
Single-slot cache of the client handle for the most recently requested config.

Acquire() with the cached config is a lock-free read. A different config takes the
mutex, retires the cached handle (release failures are logged, not raised), then
builds and publishes a new one. At most one cached handle is live at any time, and
concurrent Acquire() calls for the same config construct exactly one handle.
*/
class ClientPool {
public:
    explicit ClientPool(HandleFactory factory = MakeHttpClient);
    ~ClientPool();

    ClientPool(const ClientPool&) = delete;
    ClientPool& operator=(const ClientPool&) = delete;

    // Throws ClientCreationError (slot stays empty) if the factory fails.
    std::shared_ptr<ClientHandle> Acquire(const ClientConfig& cfg);

    // Builds an uncached handle owned by the caller, who must Release() it.
    std::unique_ptr<ClientHandle> CreateDetached(const ClientConfig& cfg) const;

    // Retires the cached handle, if any. Idempotent.
    void ReleaseAll();

    std::optional<ClientConfig> Current() const;

private:
    struct Slot {
        ClientConfig cfg;
        std::shared_ptr<ClientHandle> handle;
    };

    std::unique_ptr<ClientHandle> Create(const ClientConfig& cfg) const;
    static void Retire(ClientHandle& handle);

    HandleFactory factory_;
    std::mutex mtx_;
    // Read with std::atomic_load on the fast path; written only under mtx_.
    std::shared_ptr<const Slot> slot_;
};

}
