#include "geodetic/pool.hpp"
#include "geodetic/log.hpp"
#include <algorithm>

namespace geodetic {

void resolver_pool::lease::release() {
    if (pool_ && resolver_) {
        pool_->give_back(std::move(resolver_));
    }
    pool_ = nullptr;
    resolver_.reset();
}

resolver_pool::resolver_pool(configuration config, factory create)
    : config_(std::move(config)), create_(std::move(create)) {
    if (!create_) {
        create_ = [this]() { return std::make_unique<epsg_resolver>(config_); };
    }
    if (config_.max_pool_size == 0) {
        throw configuration_error("maxPoolSize shall be at least 1.");
    }
}

resolver_pool::~resolver_pool() {
    shutdown();
}

resolver_pool::lease resolver_pool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return shut_down_ || active_ < config_.max_pool_size; });
    return take(lock);
}

resolver_pool::lease resolver_pool::try_acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!shut_down_ && active_ >= config_.max_pool_size) {
        return {};
    }
    return take(lock);
}

resolver_pool::lease resolver_pool::take(std::unique_lock<std::mutex>& lock) {
    if (shut_down_) {
        throw connectivity_error("The resolver pool is shut down.");
    }
    ++active_;
    // Most recently used first, so that the oldest ones can time out
    while (!idle_.empty()) {
        auto resolver = std::move(idle_.back().resolver);
        idle_.pop_back();
        if (!resolver->is_closed()) {
            return lease(this, std::move(resolver));
        }
    }

    // Opening a connection does not need the pool lock
    lock.unlock();
    std::unique_ptr<epsg_resolver> created;
    try {
        created = create_();
    } catch (...) {
        // Whatever the factory threw, the slot it reserved is released
        release_slot(lock);
        throw;
    }
    if (!created) {
        release_slot(lock);
        throw connectivity_error("The resolver factory returned no resolver.");
    }
    LOG_DEBUG("pool", "Created resolver for %s", config_.path.c_str());
    return lease(this, std::move(created));
}

void resolver_pool::release_slot(std::unique_lock<std::mutex>& lock) {
    lock.lock();
    --active_;
    lock.unlock();
    available_.notify_one();
}

void resolver_pool::give_back(std::unique_ptr<epsg_resolver> resolver) {
    std::unique_lock<std::mutex> lock(mutex_);
    --active_;
    if (shut_down_ || resolver->is_closed()) {
        lock.unlock();
        close_quietly(*resolver);
        available_.notify_one();
        return;
    }
    idle_.push_back({std::move(resolver), clock::now()});
    lock.unlock();
    available_.notify_one();
}

size_t resolver_pool::retire_idle(clock::time_point now) {
    std::vector<std::unique_ptr<epsg_resolver>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = idle_.begin();
        while (it != idle_.end()) {
            if (now - it->since >= config_.idle_timeout && it->resolver->can_close()) {
                expired.push_back(std::move(it->resolver));
                it = idle_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& resolver : expired) {
        close_quietly(*resolver);
    }
    if (!expired.empty()) {
        LOG_INFO("pool", "Retired %zu idle resolver(s)", expired.size());
    }
    return expired.size();
}

size_t resolver_pool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t resolver_pool::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void resolver_pool::shutdown() {
    std::vector<idle_entry> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        idle.swap(idle_);
    }
    available_.notify_all();
    for (auto& entry : idle) {
        close_quietly(*entry.resolver);
    }
}

void resolver_pool::close_quietly(epsg_resolver& resolver) {
    try {
        resolver.close();
    } catch (const factory_error& e) {
        LOG_ERROR("pool", "Failed to close resolver: %s", e.what());
    }
}

} // namespace geodetic
