// CancellationToken.h
#pragma once

#include <atomic>
#include <memory>

namespace baseload {

/**
 * @class CancellationToken
 * @brief Shared cooperative stop flag handed to each worker loop.
 *
 * Copies share the same flag. A token created by default is live; cancel()
 * is sticky. Workers poll isCancelled() once per iteration.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }

    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace baseload
