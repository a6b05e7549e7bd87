#pragma once

#include <atomic>
#include <memory>

namespace rmp {

// Shared cooperative cancellation flag.
// Copies observe the same flag; cancel() is sticky and thread-safe.
class CancelToken {
public:
    CancelToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_flag->store(true, std::memory_order_release); }

    bool is_cancelled() const { return m_flag->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace rmp
