#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "resolver.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace geodetic {

// ============================================================================
// resolver_pool - lends resolvers to concurrent callers
//
// Each resolver owns its own connection. A resolver given back is kept idle
// and reused by the next caller. Idle resolvers are closed by retire_idle()
// once they were unused for configuration::idle_timeout, but only if they
// can be closed (no code set still held by a caller).
// ============================================================================

class resolver_pool {
public:
    using factory = std::function<std::unique_ptr<epsg_resolver>()>;
    using clock = std::chrono::steady_clock;

    /// Resolver borrowed from the pool, given back on destruction.
    class lease {
    public:
        lease() = default;
        ~lease() { release(); }

        lease(lease&& other) noexcept
            : pool_(other.pool_), resolver_(std::move(other.resolver_)) {
            other.pool_ = nullptr;
        }

        lease& operator=(lease&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                resolver_ = std::move(other.resolver_);
                other.pool_ = nullptr;
            }
            return *this;
        }

        lease(const lease&) = delete;
        lease& operator=(const lease&) = delete;

        epsg_resolver* operator->() const { return resolver_.get(); }
        epsg_resolver& operator*() const { return *resolver_; }
        epsg_resolver* get() const { return resolver_.get(); }
        explicit operator bool() const { return resolver_ != nullptr; }

        /// Gives the resolver back before the end of the scope.
        void release();

    private:
        friend class resolver_pool;
        lease(resolver_pool* pool, std::unique_ptr<epsg_resolver> resolver)
            : pool_(pool), resolver_(std::move(resolver)) {}

        resolver_pool* pool_ = nullptr;
        std::unique_ptr<epsg_resolver> resolver_;
    };

    /// `create` builds a resolver; by default one opening `config`.
    explicit resolver_pool(configuration config, factory create = {});
    ~resolver_pool();

    resolver_pool(const resolver_pool&) = delete;
    resolver_pool& operator=(const resolver_pool&) = delete;

    /// Blocks while max_pool_size resolvers are lent.
    /// Throws connectivity_error if the pool is shut down. Exceptions of the
    /// factory propagate and leave the slot free.
    lease acquire();

    /// Empty lease instead of blocking when every resolver is lent.
    lease try_acquire();

    /// Closes the resolvers idle since before `now - idle_timeout`.
    /// Returns the number of resolvers closed.
    size_t retire_idle(clock::time_point now = clock::now());

    size_t idle_count() const;
    size_t active_count() const;

    /// Closes the idle resolvers and refuses new leases. Resolvers still lent
    /// are closed when given back.
    void shutdown();

    const configuration& config() const { return config_; }

private:
    struct idle_entry {
        std::unique_ptr<epsg_resolver> resolver;
        clock::time_point since;
    };

    lease take(std::unique_lock<std::mutex>& lock);
    void release_slot(std::unique_lock<std::mutex>& lock);
    void give_back(std::unique_ptr<epsg_resolver> resolver);
    static void close_quietly(epsg_resolver& resolver);

    configuration config_;
    factory create_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<idle_entry> idle_;
    size_t active_ = 0;
    bool shut_down_ = false;
};

} // namespace geodetic

#endif // __cplusplus
