#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "chunkwise/chunk_layout.hpp"
#include "chunkwise/client/cancellation.hpp"
#include "chunkwise/client/logger.hpp"
#include "chunkwise/client/retry_policy.hpp"
#include "chunkwise/error_codes.hpp"
#include "chunkwise/protocol.hpp"

namespace chunkwise::client
{

    class ChunkSource;
    class UploadTransport;

    struct DriverConfig
    {
        std::uint64_t chunk_size{1ULL << 20};
        std::size_t parallelism{3};
        RetryPolicy retry{};
        std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
        /// Attach a BLAKE2b digest to every chunk.
        bool send_chunk_hashes{true};
        /// Hash the whole file up front so the server can verify the assembled artifact.
        bool send_file_checksum{true};
        /// How many times every chunk is re-sent after a failed assembly.
        std::size_t assembly_resend_attempts{1};
    };

    enum class ChunkState : std::uint8_t
    {
        Pending,
        InFlight,
        Retrying,
        Done,
        Failed
    };

    std::string_view to_string(ChunkState state) noexcept;

    struct DriverStatus
    {
        std::string session_id;
        std::uint64_t bytes_completed{};
        std::uint64_t bytes_total{};
        std::vector<ChunkState> chunks;
        bool paused{};
        bool cancelled{};
    };

    enum class UploadStatus : std::uint8_t
    {
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(UploadStatus status) noexcept;

    struct UploadOutcome
    {
        UploadStatus status{UploadStatus::Failed};
        std::string session_id;
        chunkwise::ErrorCode error{chunkwise::ErrorCode::Ok};
        chunkwise::FailureClass failure{chunkwise::FailureClass::None};
        std::string message;
        std::uint64_t bytes_uploaded{};
        std::size_t retries{};
    };

    /**
     * Uploads one file as a resumable chunked session.
     *
     * Begins (or resumes) the session, uploads the chunks the server lacks with a
     * bounded worker pool, retries transient failures with exponential backoff
     * and finalizes. Permanent failures and cancel() abort the session on the
     * server. Exhausting the retries of a transient failure leaves the session
     * in place so a later start() with the same id resumes it.
     */
    class UploadDriver
    {
    public:
        using ProgressCallback = std::function<void(std::uint64_t bytes_completed, std::uint64_t bytes_total)>;

        UploadDriver(UploadTransport &transport, std::shared_ptr<const ChunkSource> source, DriverConfig config,
                     Logger logger = Logger{});
        ~UploadDriver();

        UploadDriver(const UploadDriver &) = delete;
        UploadDriver &operator=(const UploadDriver &) = delete;

        /// Called from worker threads with non-decreasing byte counts. Set before start().
        void on_progress(ProgressCallback callback);

        /// Returns at once; the upload runs on a driver-owned thread. Callable once.
        std::future<UploadOutcome> start(std::optional<std::string> session_id = std::nullopt);

        void cancel();
        void pause();
        void resume();

        DriverStatus status() const;

    private:
        struct Round;

        UploadOutcome run(std::optional<std::string> session_id);
        UploadOutcome finish(UploadStatus status, chunkwise::ErrorCode error, std::string message);
        UploadOutcome fail_and_abort(chunkwise::ErrorCode error, std::string message);

        std::optional<std::string> file_checksum();
        void upload_round(const std::vector<std::uint64_t> &indices, Round &round);
        void upload_chunk(std::uint64_t index, Round &round);
        nlohmann::json chunk_payload(std::uint64_t index, const std::vector<std::byte> &bytes) const;

        protocol::ResponseEnvelope call_once(protocol::Command command, const nlohmann::json &payload,
                                             const CancellationToken &token, bool interruptible);
        protocol::ResponseEnvelope call_with_retry(protocol::Command command, const nlohmann::json &payload);
        void abort_remote();

        bool wait_while_paused(const CancellationToken &token);
        void set_chunk_state(std::uint64_t index, ChunkState state);
        void mark_done(std::uint64_t index);
        void report_progress();

        UploadTransport &transport_;
        std::shared_ptr<const ChunkSource> source_;
        DriverConfig config_;
        Logger logger_;
        ProgressCallback progress_;

        CancellationToken token_;
        std::thread thread_;
        std::atomic<bool> started_{false};

        mutable std::mutex mutex_;
        std::condition_variable pause_cv_;
        bool paused_{false};
        std::string session_id_;
        ChunkLayout layout_{};
        std::vector<ChunkState> chunks_;
        std::vector<bool> counted_;
        std::uint64_t bytes_completed_{0};
        std::optional<CancellationToken> round_token_;
        std::atomic<std::size_t> retries_{0};

        std::mutex progress_mutex_;
        std::uint64_t last_reported_{0};
        bool reported_any_{false};
    };

} // namespace chunkwise::client
