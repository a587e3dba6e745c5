#pragma once

#include <functional>
#include <utility>

namespace pp::core::app {

// Move-only handle for a live bridge subscription.
// cancel() is idempotent; destroying the handle cancels it.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> canceller)
        : canceller_(std::move(canceller)) {
    }

    ~Subscription() {
        cancel();
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : canceller_(std::exchange(other.canceller_, nullptr)) {
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            canceller_ = std::exchange(other.canceller_, nullptr);
        }
        return *this;
    }

    void cancel() {
        if (!canceller_) {
            return;
        }
        auto c = std::exchange(canceller_, nullptr);
        c();
    }

    bool isActive() const noexcept {
        return static_cast<bool>(canceller_);
    }

private:
    std::function<void()> canceller_;
};

} // namespace pp::core::app
