#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

namespace scheduling {

// Keys of events that already have a submitted call job. Entries are never
// removed; the set lives as long as the process.
class EventRegistry {
public:
    bool is_scheduled(const std::string& key) const;
    // Returns false when the key was already present.
    bool mark_scheduled(const std::string& key);
    std::size_t size() const;
private:
    mutable std::mutex mu_;
    std::unordered_set<std::string> keys_;
};

}
