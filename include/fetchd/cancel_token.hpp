#pragma once

#include <atomic>
#include <memory>

namespace fetchd {

// Cooperative cancellation flag shared between the manager and a running
// transfer. Copies refer to the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace fetchd
