#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace chunkwise::client
{

    /// Shared cancellation flag; copies observe the same state.
    class CancellationToken
    {
    public:
        CancellationToken();

        void cancel();

        bool is_cancelled() const;

        /// Sleeps for `duration` unless cancelled first. Returns true when cancelled.
        bool wait_for(std::chrono::milliseconds duration) const;

    private:
        struct State
        {
            mutable std::mutex mutex;
            std::condition_variable cv;
            bool cancelled{false};
        };

        std::shared_ptr<State> state_;
    };

} // namespace chunkwise::client
