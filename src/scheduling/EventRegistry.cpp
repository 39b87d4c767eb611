#include "EventRegistry.h"

namespace scheduling {

bool EventRegistry::is_scheduled(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    return keys_.count(key) != 0;
}

bool EventRegistry::mark_scheduled(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    return keys_.insert(key).second;
}

std::size_t EventRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return keys_.size();
}

}
