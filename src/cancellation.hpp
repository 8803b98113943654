#pragma once
#include <atomic>
#include <memory>

namespace agnt {

// Shared, copyable cancellation signal. Copies observe the same flag; once
// cancelled it stays cancelled.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }

    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

    // Raw flag for transports that poll it while blocked on the network.
    // Valid for as long as any copy of the token is alive.
    const std::atomic<bool>* flag() const { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace agnt
