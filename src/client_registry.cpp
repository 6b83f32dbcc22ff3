/*
* @license
* (C) zachbabanov
*
*/

#include <client_registry.hpp>
#include <logger.hpp>

using namespace framecast::registry;
using namespace framecast::common;

ClientRegistry::ClientRegistry(std::chrono::milliseconds timeout, size_t max_clients)
        : timeout_(timeout), max_clients_(max_clients) {}

RegisterResult ClientRegistry::register_client(const Endpoint &addr, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sessions_.find(addr);
    if (it != sessions_.end()) {
        it->second.last_seen_at = now;
        LOG_REG_DEBUG("Client re-registered: {}", addr.to_string());
        return RegisterResult::Refreshed;
    }
    if (sessions_.size() >= max_clients_) {
        LOG_REG_WARN("Registry full ({} clients), refusing {}", sessions_.size(), addr.to_string());
        return RegisterResult::Refused;
    }
    ClientSession s;
    s.address = addr;
    s.registered_at = now;
    s.last_seen_at = now;
    sessions_.emplace(addr, s);
    LOG_REG_INFO("Client registered: {} - frames will be sent to this exact address (clients={})",
                 addr.to_string(), sessions_.size());
    return RegisterResult::Registered;
}

bool ClientRegistry::keepalive(const Endpoint &addr, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sessions_.find(addr);
    if (it == sessions_.end()) {
        LOG_REG_DEBUG("KEEPALIVE from unregistered {} ignored", addr.to_string());
        return false;
    }
    it->second.last_seen_at = now;
    LOG_REG_TRACE("KEEPALIVE from {}", addr.to_string());
    return true;
}

bool ClientRegistry::disconnect(const Endpoint &addr) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (sessions_.erase(addr) == 0) {
        LOG_REG_DEBUG("DISCONNECT from unregistered {} ignored", addr.to_string());
        return false;
    }
    LOG_REG_INFO("Client disconnected: {} (clients={})", addr.to_string(), sessions_.size());
    return true;
}

std::vector<Endpoint> ClientRegistry::sweep(Clock::time_point now) {
    std::vector<Endpoint> evicted;
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now > it->second.last_seen_at && now - it->second.last_seen_at > timeout_) {
            LOG_REG_INFO("Removed inactive client: {} (silent {} ms)",
                         it->first.to_string(), elapsed_ms(it->second.last_seen_at, now));
            evicted.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<Endpoint> ClientRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Endpoint> out;
    out.reserve(sessions_.size());
    for (const auto &kv : sessions_) out.push_back(kv.first);
    return out;
}

bool ClientRegistry::contains(const Endpoint &addr) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return sessions_.count(addr) != 0;
}

size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return sessions_.size();
}
