#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace web {

// Single-slot message shown once on the next listing render.
class Flash {
public:
    void set(std::string message) {
        std::lock_guard lock(mu_);
        message_ = std::move(message);
    }
    std::optional<std::string> take() {
        std::lock_guard lock(mu_);
        auto m = std::move(message_);
        message_.reset();
        return m;
    }
private:
    std::mutex mu_;
    std::optional<std::string> message_;
};

}
