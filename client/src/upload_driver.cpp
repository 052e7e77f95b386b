#include "chunkwise/client/upload_driver.hpp"

#include <algorithm>
#include <stdexcept>

#include "chunkwise/client/chunk_source.hpp"
#include "chunkwise/client/upload_transport.hpp"
#include "chunkwise/client/worker_pool.hpp"
#include "chunkwise/crypto.hpp"
#include "chunkwise/encoding/base64.hpp"

namespace chunkwise::client
{

    namespace
    {

        constexpr auto kPollInterval = std::chrono::milliseconds{20};
        // Slack on top of the transport's own timeout before a call is given up locally.
        constexpr auto kTransportGrace = std::chrono::seconds{2};
        // Finalize rounds that may follow the first upload round.
        constexpr std::size_t kMaxExtraRounds = 5;
        constexpr std::uint64_t kChecksumBlock = 4ULL * 1024 * 1024;

        protocol::ResponseEnvelope error_envelope(chunkwise::ErrorCode code, std::string message)
        {
            protocol::ResponseEnvelope envelope;
            envelope.kind = protocol::ResponseKind::Error;
            envelope.error = code;
            envelope.message = std::move(message);
            return envelope;
        }

    } // namespace

    std::string_view to_string(ChunkState state) noexcept
    {
        switch (state)
        {
        case ChunkState::Pending:
            return "pending";
        case ChunkState::InFlight:
            return "in_flight";
        case ChunkState::Retrying:
            return "retrying";
        case ChunkState::Done:
            return "done";
        case ChunkState::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::string_view to_string(UploadStatus status) noexcept
    {
        switch (status)
        {
        case UploadStatus::Completed:
            return "completed";
        case UploadStatus::Failed:
            return "failed";
        case UploadStatus::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    struct UploadDriver::Round
    {
        CancellationToken token;
        std::mutex mutex;
        bool assembled{false};
        bool assembly_failed{false};
        std::string assembly_message;
        std::optional<std::pair<chunkwise::ErrorCode, std::string>> fatal;
        std::optional<std::pair<chunkwise::ErrorCode, std::string>> exhausted;

        void record_assembled()
        {
            std::lock_guard lock(mutex);
            assembled = true;
        }

        void record_assembly_failed(const std::string &message)
        {
            std::lock_guard lock(mutex);
            assembly_failed = true;
            assembly_message = message;
        }

        /// Permanent failure: stops the round.
        void record_fatal(chunkwise::ErrorCode code, const std::string &message)
        {
            {
                std::lock_guard lock(mutex);
                if (!fatal && !exhausted)
                {
                    fatal.emplace(code, message);
                }
            }
            token.cancel();
        }

        /// Transient failure that used up its retries: stops the round.
        void record_exhausted(chunkwise::ErrorCode code, const std::string &message)
        {
            {
                std::lock_guard lock(mutex);
                if (!fatal && !exhausted)
                {
                    exhausted.emplace(code, message);
                }
            }
            token.cancel();
        }
    };

    UploadDriver::UploadDriver(UploadTransport &transport, std::shared_ptr<const ChunkSource> source,
                               DriverConfig config, Logger logger)
        : transport_(transport), source_(std::move(source)), config_(std::move(config)), logger_(std::move(logger))
    {
        if (!source_)
        {
            throw std::invalid_argument("UploadDriver requires a chunk source");
        }
        if (config_.chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        if (config_.parallelism == 0)
        {
            config_.parallelism = 1;
        }
        if (config_.retry.max_attempts == 0)
        {
            config_.retry.max_attempts = 1;
        }
        layout_ = ChunkLayout{source_->size(), config_.chunk_size};
    }

    UploadDriver::~UploadDriver()
    {
        cancel();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    void UploadDriver::on_progress(ProgressCallback callback)
    {
        progress_ = std::move(callback);
    }

    std::future<UploadOutcome> UploadDriver::start(std::optional<std::string> session_id)
    {
        if (started_.exchange(true))
        {
            throw std::logic_error("UploadDriver::start called twice");
        }
        auto promise = std::make_shared<std::promise<UploadOutcome>>();
        auto future = promise->get_future();
        thread_ = std::thread([this, promise, session_id = std::move(session_id)]() mutable
                              {
            try
            {
                promise->set_value(run(std::move(session_id)));
            }
            catch (const std::exception &ex)
            {
                logger_.warn("upload", "Upload stopped by local error: ", ex.what());
                promise->set_value(finish(UploadStatus::Failed, chunkwise::ErrorCode::InternalError, ex.what()));
            } });
        return future;
    }

    void UploadDriver::cancel()
    {
        token_.cancel();
        {
            std::lock_guard lock(mutex_);
            if (round_token_)
            {
                round_token_->cancel();
            }
        }
        pause_cv_.notify_all();
    }

    void UploadDriver::pause()
    {
        std::lock_guard lock(mutex_);
        paused_ = true;
    }

    void UploadDriver::resume()
    {
        {
            std::lock_guard lock(mutex_);
            paused_ = false;
        }
        pause_cv_.notify_all();
    }

    DriverStatus UploadDriver::status() const
    {
        std::lock_guard lock(mutex_);
        return DriverStatus{
            .session_id = session_id_,
            .bytes_completed = bytes_completed_,
            .bytes_total = layout_.total_size,
            .chunks = chunks_,
            .paused = paused_,
            .cancelled = token_.is_cancelled(),
        };
    }

    UploadOutcome UploadDriver::run(std::optional<std::string> session_id)
    {
        const auto total_size = source_->size();
        {
            std::lock_guard lock(mutex_);
            chunks_.assign(layout_.total_chunks(), ChunkState::Pending);
            counted_.assign(chunks_.size(), false);
        }
        logger_.log("upload", "Uploading ", source_->file_name(), " (", total_size, " bytes, ",
                    layout_.total_chunks(), " chunks)");

        std::optional<std::string> checksum;
        if (config_.send_file_checksum)
        {
            checksum = file_checksum();
        }
        if (token_.is_cancelled())
        {
            return finish(UploadStatus::Cancelled, chunkwise::ErrorCode::Ok, "Cancelled before the session started");
        }

        const protocol::BeginSessionRequest begin{
            .file_name = source_->file_name(),
            .total_size = total_size,
            .chunk_size = config_.chunk_size,
            .session_id = session_id,
            .checksum = checksum,
        };
        const auto response = call_with_retry(protocol::Command::BeginSession, begin);
        if (response.kind == protocol::ResponseKind::Error)
        {
            if (token_.is_cancelled())
            {
                if (session_id)
                {
                    // The server may have created the session before the cancel cut the call short.
                    {
                        std::lock_guard lock(mutex_);
                        session_id_ = *session_id;
                    }
                    abort_remote();
                }
                return finish(UploadStatus::Cancelled, chunkwise::ErrorCode::Ok, "Upload cancelled");
            }
            return finish(UploadStatus::Failed, response.error, response.message);
        }

        const auto descriptor = response.payload.get<protocol::SessionDescriptor>();
        {
            std::lock_guard lock(mutex_);
            session_id_ = descriptor.session_id;
            if (descriptor.chunk_size != layout_.chunk_size)
            {
                layout_.chunk_size = descriptor.chunk_size;
                chunks_.assign(layout_.total_chunks(), ChunkState::Pending);
                counted_.assign(chunks_.size(), false);
            }
        }
        if (token_.is_cancelled())
        {
            abort_remote();
            return finish(UploadStatus::Cancelled, chunkwise::ErrorCode::Ok, "Upload cancelled");
        }
        for (const auto index : descriptor.received)
        {
            if (index < layout_.total_chunks())
            {
                mark_done(index);
            }
        }
        report_progress();
        if (descriptor.resumed)
        {
            logger_.log("upload", "Resumed session ", descriptor.session_id, " with ", descriptor.received.size(),
                        " of ", descriptor.total_chunks, " chunks on the server");
        }
        if (descriptor.assembled)
        {
            return finish(UploadStatus::Completed, chunkwise::ErrorCode::Ok, {});
        }

        auto resends_left = config_.assembly_resend_attempts;
        std::size_t extra_rounds = 0;
        bool resend_all = false;
        for (;;)
        {
            std::vector<std::uint64_t> indices;
            {
                std::lock_guard lock(mutex_);
                for (std::uint64_t index = 0; index < chunks_.size(); ++index)
                {
                    if (resend_all || chunks_[index] != ChunkState::Done)
                    {
                        indices.push_back(index);
                    }
                }
            }
            resend_all = false;

            Round round;
            {
                std::lock_guard lock(mutex_);
                round_token_ = round.token;
            }
            if (token_.is_cancelled())
            {
                round.token.cancel();
            }
            upload_round(indices, round);
            {
                std::lock_guard lock(mutex_);
                round_token_.reset();
            }

            if (token_.is_cancelled())
            {
                abort_remote();
                return finish(UploadStatus::Cancelled, chunkwise::ErrorCode::Ok, "Upload cancelled");
            }
            if (round.fatal)
            {
                return fail_and_abort(round.fatal->first, round.fatal->second);
            }
            if (round.exhausted)
            {
                return finish(UploadStatus::Failed, round.exhausted->first, round.exhausted->second);
            }
            if (round.assembled)
            {
                return finish(UploadStatus::Completed, chunkwise::ErrorCode::Ok, {});
            }

            bool assembly_failed = round.assembly_failed;
            std::string assembly_message = round.assembly_message;
            if (!assembly_failed)
            {
                const auto finalize = call_with_retry(protocol::Command::FinalizeSession,
                                                      protocol::SessionRequest{.session_id = descriptor.session_id});
                if (token_.is_cancelled())
                {
                    abort_remote();
                    return finish(UploadStatus::Cancelled, chunkwise::ErrorCode::Ok, "Upload cancelled");
                }
                if (finalize.kind == protocol::ResponseKind::Ok)
                {
                    const auto ack = finalize.payload.get<protocol::ChunkAck>();
                    if (ack.assembled)
                    {
                        return finish(UploadStatus::Completed, chunkwise::ErrorCode::Ok, {});
                    }
                    // Another request holds the assembly; check again shortly.
                    if (++extra_rounds > kMaxExtraRounds)
                    {
                        return finish(UploadStatus::Failed, chunkwise::ErrorCode::Busy,
                                      "Server did not finish assembling the upload");
                    }
                    if (token_.wait_for(config_.retry.backoff_for(extra_rounds)))
                    {
                        abort_remote();
                        return finish(UploadStatus::Cancelled, chunkwise::ErrorCode::Ok, "Upload cancelled");
                    }
                    continue;
                }
                if (finalize.error == chunkwise::ErrorCode::InvalidChunk)
                {
                    if (++extra_rounds > kMaxExtraRounds)
                    {
                        return fail_and_abort(chunkwise::ErrorCode::InvalidChunk,
                                              "Chunks still missing after repeated uploads");
                    }
                    const auto missing =
                        finalize.payload.value("missing", std::vector<std::uint64_t>{});
                    logger_.warn("upload", "Server is missing ", missing.size(), " chunks, uploading them again");
                    std::lock_guard lock(mutex_);
                    for (const auto index : missing)
                    {
                        if (index < chunks_.size())
                        {
                            chunks_[index] = ChunkState::Pending;
                        }
                    }
                    continue;
                }
                if (finalize.error != chunkwise::ErrorCode::AssemblyFailed)
                {
                    if (chunkwise::is_transient(finalize.error))
                    {
                        return finish(UploadStatus::Failed, finalize.error, finalize.message);
                    }
                    return fail_and_abort(finalize.error, finalize.message);
                }
                assembly_failed = true;
                assembly_message = finalize.message;
            }

            if (resends_left == 0)
            {
                return finish(UploadStatus::Failed, chunkwise::ErrorCode::AssemblyFailed, assembly_message);
            }
            --resends_left;
            resend_all = true;
            logger_.warn("assembly", "Assembly failed (", assembly_message, "), re-sending every chunk");
        }
    }

    UploadOutcome UploadDriver::finish(UploadStatus status, chunkwise::ErrorCode error, std::string message)
    {
        UploadOutcome outcome;
        outcome.status = status;
        outcome.error = error;
        outcome.failure = status == UploadStatus::Failed ? chunkwise::classify(error) : chunkwise::FailureClass::None;
        outcome.message = std::move(message);
        outcome.retries = retries_.load();
        {
            std::lock_guard lock(mutex_);
            outcome.session_id = session_id_;
            outcome.bytes_uploaded = bytes_completed_;
        }
        if (status == UploadStatus::Failed)
        {
            logger_.warn("upload", "Session ", outcome.session_id, " failed: ", chunkwise::to_string(error), " ",
                         outcome.message);
        }
        else
        {
            logger_.log("upload", "Session ", outcome.session_id, " ", to_string(status), " after ",
                        outcome.retries, " retries");
        }
        return outcome;
    }

    UploadOutcome UploadDriver::fail_and_abort(chunkwise::ErrorCode error, std::string message)
    {
        abort_remote();
        return finish(UploadStatus::Failed, error, std::move(message));
    }

    std::optional<std::string> UploadDriver::file_checksum()
    {
        crypto::StreamingHash digest;
        const auto total = source_->size();
        const auto block = std::max<std::uint64_t>(1, std::min(config_.chunk_size, kChecksumBlock));
        for (std::uint64_t offset = 0; offset < total; offset += block)
        {
            if (token_.is_cancelled())
            {
                return std::nullopt;
            }
            const auto length = static_cast<std::size_t>(std::min(block, total - offset));
            digest.update(source_->read(offset, length));
        }
        return digest.finish();
    }

    void UploadDriver::upload_round(const std::vector<std::uint64_t> &indices, Round &round)
    {
        if (indices.empty())
        {
            return;
        }
        WorkerPool pool(std::min(config_.parallelism, indices.size()), round.token);
        for (const auto index : indices)
        {
            pool.submit([this, index, &round]
                        { upload_chunk(index, round); });
        }
        try
        {
            pool.wait_idle();
        }
        catch (...)
        {
            round.token.cancel();
            throw;
        }
    }

    void UploadDriver::upload_chunk(std::uint64_t index, Round &round)
    {
        if (!wait_while_paused(round.token))
        {
            return;
        }
        set_chunk_state(index, ChunkState::InFlight);

        ChunkLayout layout;
        {
            std::lock_guard lock(mutex_);
            layout = layout_;
        }
        const auto bytes = source_->read(layout.chunk_offset(index),
                                         static_cast<std::size_t>(layout.chunk_length(index)));
        const auto payload = chunk_payload(index, bytes);

        for (std::size_t attempt = 1;; ++attempt)
        {
            const auto response = call_once(protocol::Command::UploadChunk, payload, round.token, true);
            if (response.kind == protocol::ResponseKind::Ok)
            {
                const auto ack = response.payload.get<protocol::ChunkAck>();
                mark_done(index);
                report_progress();
                if (ack.assembled)
                {
                    round.record_assembled();
                }
                return;
            }
            if (round.token.is_cancelled())
            {
                set_chunk_state(index, ChunkState::Pending);
                return;
            }
            if (response.error == chunkwise::ErrorCode::AssemblyFailed)
            {
                // The chunk was stored; only the merge failed.
                mark_done(index);
                report_progress();
                round.record_assembly_failed(response.message);
                return;
            }
            if (!chunkwise::is_transient(response.error))
            {
                set_chunk_state(index, ChunkState::Failed);
                round.record_fatal(response.error, response.message);
                return;
            }
            if (attempt >= config_.retry.max_attempts)
            {
                set_chunk_state(index, ChunkState::Failed);
                round.record_exhausted(response.error, response.message);
                return;
            }

            set_chunk_state(index, ChunkState::Retrying);
            ++retries_;
            logger_.warn("chunk", "Chunk ", index, " attempt ", attempt, " failed (",
                         chunkwise::to_string(response.error), "): ", response.message);
            if (round.token.wait_for(config_.retry.backoff_for(attempt)))
            {
                set_chunk_state(index, ChunkState::Pending);
                return;
            }
        }
    }

    nlohmann::json UploadDriver::chunk_payload(std::uint64_t index, const std::vector<std::byte> &bytes) const
    {
        protocol::UploadChunkRequest request;
        {
            std::lock_guard lock(mutex_);
            request.session_id = session_id_;
            request.total_chunks = layout_.total_chunks();
            request.chunk_size = layout_.chunk_size;
            request.total_size = layout_.total_size;
        }
        request.index = index;
        request.file_name = source_->file_name();
        request.data_base64 = encoding::encode_base64(bytes);
        if (config_.send_chunk_hashes)
        {
            request.chunk_hash = crypto::hash_bytes(bytes);
        }
        return request;
    }

    protocol::ResponseEnvelope UploadDriver::call_once(protocol::Command command, const nlohmann::json &payload,
                                                       const CancellationToken &token, bool interruptible)
    {
        std::future<protocol::ResponseEnvelope> future;
        try
        {
            future = transport_.call(command, payload, config_.request_timeout);
        }
        catch (const TransportError &ex)
        {
            return error_envelope(ex.code(), ex.what());
        }

        const auto deadline = std::chrono::steady_clock::now() + config_.request_timeout + kTransportGrace;
        while (future.wait_for(kPollInterval) != std::future_status::ready)
        {
            if (interruptible && token.is_cancelled())
            {
                return error_envelope(chunkwise::ErrorCode::NetworkError, "Cancelled");
            }
            if (std::chrono::steady_clock::now() > deadline)
            {
                return error_envelope(chunkwise::ErrorCode::Timeout, "No response within the request timeout");
            }
        }

        try
        {
            return future.get();
        }
        catch (const TransportError &ex)
        {
            return error_envelope(ex.code(), ex.what());
        }
    }

    protocol::ResponseEnvelope UploadDriver::call_with_retry(protocol::Command command, const nlohmann::json &payload)
    {
        for (std::size_t attempt = 1;; ++attempt)
        {
            auto response = call_once(command, payload, token_, true);
            if (response.kind == protocol::ResponseKind::Ok || !chunkwise::is_transient(response.error) ||
                attempt >= config_.retry.max_attempts || token_.is_cancelled())
            {
                return response;
            }
            ++retries_;
            logger_.warn("rpc", protocol::to_string(command), " attempt ", attempt, " failed (",
                         chunkwise::to_string(response.error), "): ", response.message);
            if (token_.wait_for(config_.retry.backoff_for(attempt)))
            {
                return response;
            }
        }
    }

    void UploadDriver::abort_remote()
    {
        std::string session_id;
        {
            std::lock_guard lock(mutex_);
            session_id = session_id_;
        }
        if (session_id.empty())
        {
            return;
        }
        const auto response = call_once(protocol::Command::AbortSession,
                                        protocol::SessionRequest{.session_id = session_id}, token_, false);
        if (response.kind == protocol::ResponseKind::Error)
        {
            logger_.warn("upload", "Abort of session ", session_id, " failed: ", response.message);
            return;
        }
        logger_.log("upload", "Session ", session_id, " aborted");
    }

    bool UploadDriver::wait_while_paused(const CancellationToken &token)
    {
        std::unique_lock lock(mutex_);
        while (paused_ && !token.is_cancelled())
        {
            pause_cv_.wait_for(lock, kPollInterval);
        }
        return !token.is_cancelled();
    }

    void UploadDriver::set_chunk_state(std::uint64_t index, ChunkState state)
    {
        std::lock_guard lock(mutex_);
        if (index < chunks_.size())
        {
            chunks_[index] = state;
        }
    }

    void UploadDriver::mark_done(std::uint64_t index)
    {
        std::lock_guard lock(mutex_);
        if (index >= chunks_.size())
        {
            return;
        }
        chunks_[index] = ChunkState::Done;
        if (!counted_[index])
        {
            counted_[index] = true;
            bytes_completed_ += layout_.chunk_length(index);
        }
    }

    void UploadDriver::report_progress()
    {
        if (!progress_)
        {
            return;
        }
        std::lock_guard progress_lock(progress_mutex_);
        std::uint64_t completed = 0;
        std::uint64_t total = 0;
        {
            std::lock_guard lock(mutex_);
            completed = bytes_completed_;
            total = layout_.total_size;
        }
        if (reported_any_ && completed <= last_reported_)
        {
            return;
        }
        reported_any_ = true;
        last_reported_ = completed;
        progress_(completed, total);
    }

} // namespace chunkwise::client
