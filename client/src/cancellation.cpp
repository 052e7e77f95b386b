#include "chunkwise/client/cancellation.hpp"

namespace chunkwise::client
{

    CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

    void CancellationToken::cancel()
    {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool CancellationToken::is_cancelled() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    bool CancellationToken::wait_for(std::chrono::milliseconds duration) const
    {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, duration, [this]
                                   { return state_->cancelled; });
    }

} // namespace chunkwise::client
