#include "rerank_bench/client_pool.hpp"
#include "rerank_bench/errors.hpp"
#include "rerank_bench/logger.hpp"

#include <atomic>

namespace rerank_bench {

ClientPool::ClientPool(HandleFactory factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = MakeHttpClient;
    }
}

ClientPool::~ClientPool() {
    ReleaseAll();
}

std::shared_ptr<ClientHandle> ClientPool::Acquire(const ClientConfig& cfg) {
    auto snapshot = std::atomic_load(&slot_);
    if (snapshot && snapshot->cfg == cfg) {
        return snapshot->handle;
    }

    std::lock_guard<std::mutex> lk(mtx_);
    // Another caller may have installed this config while we waited.
    snapshot = std::atomic_load(&slot_);
    if (snapshot) {
        if (snapshot->cfg == cfg) {
            return snapshot->handle;
        }
        RB_LOG_INFO("client pool: config changed ({} -> {}), retiring old client",
                    snapshot->cfg.Endpoint(), cfg.Endpoint());
        std::atomic_store(&slot_, std::shared_ptr<const Slot>{});
        Retire(*snapshot->handle);
    }

    std::shared_ptr<ClientHandle> handle = Create(cfg);
    std::atomic_store(&slot_, std::shared_ptr<const Slot>(std::make_shared<Slot>(Slot{cfg, handle})));
    RB_LOG_DEBUG("client pool: installed client for {}", cfg.Endpoint());
    return handle;
}

std::unique_ptr<ClientHandle> ClientPool::CreateDetached(const ClientConfig& cfg) const {
    return Create(cfg);
}

void ClientPool::ReleaseAll() {
    std::lock_guard<std::mutex> lk(mtx_);
    auto snapshot = std::atomic_load(&slot_);
    if (!snapshot) {
        return;
    }
    std::atomic_store(&slot_, std::shared_ptr<const Slot>{});
    Retire(*snapshot->handle);
}

std::optional<ClientConfig> ClientPool::Current() const {
    auto snapshot = std::atomic_load(&slot_);
    if (!snapshot) {
        return std::nullopt;
    }
    return snapshot->cfg;
}

std::unique_ptr<ClientHandle> ClientPool::Create(const ClientConfig& cfg) const {
    auto handle = factory_(cfg);
    if (!handle) {
        throw ClientCreationError("client factory returned no handle for " + cfg.Endpoint());
    }
    return handle;
}

void ClientPool::Retire(ClientHandle& handle) {
    auto r = handle.Release();
    if (!r) {
        RB_LOG_WARN("client pool: release failed, ignoring: {}", r.message);
    }
}

}
