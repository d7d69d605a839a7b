#pragma once

#include <atomic>

namespace toolbridge {

/// Cooperative cancellation flag shared between the dispatcher and one running tool call.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool is_cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace toolbridge
