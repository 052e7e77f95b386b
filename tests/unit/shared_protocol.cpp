#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkwise/chunk_layout.hpp"
#include "chunkwise/crypto.hpp"
#include "chunkwise/encoding/base64.hpp"
#include "chunkwise/error_codes.hpp"
#include "chunkwise/framing.hpp"
#include "chunkwise/protocol.hpp"

using namespace chunkwise;
using namespace chunkwise::protocol;

void run_server_component_tests();
void run_client_driver_tests();
void run_end_to_end_tests();

namespace
{

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        std::vector<std::byte> out;
        for (const char c : text)
        {
            out.push_back(static_cast<std::byte>(c));
        }
        return out;
    }

    void test_request_envelope()
    {
        RequestEnvelope request{
            .command = Command::QueryMissing,
            .payload = SessionRequest{.session_id = "abc"},
            .request_id = "r7",
        };
        const nlohmann::json json = request;
        assert(json.at("cmd") == "QUERY_MISSING");
        assert(json.at("id") == "r7");

        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::QueryMissing);
        assert(decoded.payload.at("session_id") == "abc");

        bool threw = false;
        try
        {
            (void)nlohmann::json{{"cmd", "DELETE_EVERYTHING"}}.get<RequestEnvelope>();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_response_envelope_error()
    {
        ResponseEnvelope response;
        response.kind = ResponseKind::Error;
        response.error = ErrorCode::SessionConflict;
        response.message = "shape differs";
        response.request_id = "r1";

        const nlohmann::json json = response;
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == to_int(ErrorCode::SessionConflict));

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::SessionConflict);
        assert(decoded.message == "shape differs");
        assert(decoded.request_id == std::optional<std::string>("r1"));
    }

    void test_begin_request_optional_fields()
    {
        const nlohmann::json minimal = {{"file_name", "a.bin"}, {"total_size", 10}, {"chunk_size", 4}};
        const auto request = minimal.get<BeginSessionRequest>();
        assert(!request.session_id);
        assert(!request.checksum);

        const nlohmann::json encoded = request;
        assert(!encoded.contains("session_id"));
        assert(!encoded.contains("checksum"));
    }

    void test_upload_chunk_wire_names()
    {
        UploadChunkRequest request{
            .session_id = "s1",
            .index = 2,
            .total_chunks = 3,
            .chunk_size = 1000000,
            .file_name = "video.mp4",
            .total_size = 2500000,
            .data_base64 = "AAEC",
            .chunk_hash = "deadbeef",
        };
        const nlohmann::json json = request;
        assert(json.at("data") == "AAEC");
        assert(json.at("hash") == "deadbeef");

        const auto decoded = json.get<UploadChunkRequest>();
        assert(decoded.index == 2);
        assert(decoded.total_size == 2500000);
        assert(decoded.chunk_hash == std::optional<std::string>("deadbeef"));
    }

    void test_session_status_progress()
    {
        SessionStatusResponse status{
            .session_id = "s",
            .file_name = "f",
            .phase = "receiving",
            .received_chunks = 1,
            .total_chunks = 4,
            .received_bytes = 250,
            .total_size = 1000,
        };
        assert(status.progress() > 0.249 && status.progress() < 0.251);

        status.total_size = 0;
        status.total_chunks = 0;
        status.received_chunks = 0;
        assert(status.progress() == 1.0);
    }

    void test_framing()
    {
        const nlohmann::json message = {{"cmd", "PING"}, {"payload", nlohmann::json::object()}};
        const auto frame = encode_frame(message);
        assert(frame.size() > kFrameHeaderSize);

        std::array<std::uint8_t, kFrameHeaderSize> header{};
        std::copy(frame.begin(), frame.begin() + kFrameHeaderSize, header.begin());
        assert(decode_frame_header(header) == frame.size() - kFrameHeaderSize);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial);

        const auto decoded = try_decode_frame(frame);
        assert(decoded);
        assert(decoded->bytes_consumed == frame.size());
        assert(decoded->message == message);

        const std::vector<std::uint8_t> oversized = {0xFF, 0xFF, 0xFF, 0xFF};
        bool threw = false;
        try
        {
            (void)try_decode_frame(oversized);
        }
        catch (const std::length_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_base64()
    {
        assert(encoding::encode_base64(bytes_of("")) == "");
        assert(encoding::encode_base64(bytes_of("f")) == "Zg==");
        assert(encoding::encode_base64(bytes_of("foobar")) == "Zm9vYmFy");
        assert(encoding::decode_base64("Zm9v\nYmE=") == bytes_of("fooba"));

        for (const auto *bad : {"Zm9v!", "Zg==Zg==", "Z"})
        {
            bool threw = false;
            try
            {
                (void)encoding::decode_base64(bad);
            }
            catch (const std::invalid_argument &)
            {
                threw = true;
            }
            assert(threw);
        }
    }

    void test_crypto()
    {
        const auto data = bytes_of("chunkwise");
        const auto digest = crypto::hash_bytes(data);
        assert(digest.size() == 64);
        assert(digest == crypto::hash_bytes(data));
        assert(digest != crypto::hash_bytes(bytes_of("chunkwisE")));

        crypto::StreamingHash streaming;
        streaming.update(bytes_of("chunk"));
        streaming.update(bytes_of("wise"));
        assert(streaming.finish() == digest);

        const auto path = std::filesystem::temp_directory_path() / ("chunkwise_hash_" + crypto::random_hex(6));
        {
            std::ofstream out(path, std::ios::binary);
            out << "chunkwise";
        }
        assert(crypto::hash_file(path) == digest);
        std::filesystem::remove(path);
        bool threw = false;
        try
        {
            (void)crypto::hash_file(path);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        const auto id = crypto::random_hex(16);
        assert(id.size() == 32);
        assert(id != crypto::random_hex(16));
    }

    void test_chunk_layout()
    {
        const ChunkLayout layout{2500000, 1000000};
        assert(layout.total_chunks() == 3);
        assert(layout.chunk_offset(2) == 2000000);
        assert(layout.chunk_length(0) == 1000000);
        assert(layout.chunk_length(2) == 500000);

        const ChunkLayout exact{3000000, 1000000};
        assert(exact.total_chunks() == 3);
        assert(exact.chunk_length(2) == 1000000);

        const ChunkLayout empty{0, 1000000};
        assert(empty.total_chunks() == 0);

        bool threw = false;
        try
        {
            (void)layout.chunk_length(3);
        }
        catch (const std::out_of_range &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_error_classification()
    {
        assert(classify(ErrorCode::Ok) == FailureClass::None);
        assert(classify(ErrorCode::Timeout) == FailureClass::RetryAutomatically);
        assert(classify(ErrorCode::UnknownSession) == FailureClass::RestartUpload);
        assert(classify(ErrorCode::SessionConflict) == FailureClass::RestartUpload);
        assert(classify(ErrorCode::UploadRejected) == FailureClass::ContactSupport);
        assert(classify(ErrorCode::InvalidChunk) == FailureClass::ContactSupport);

        assert(is_transient(ErrorCode::Busy));
        assert(is_transient(ErrorCode::ChecksumMismatch));
        assert(is_transient(ErrorCode::NetworkError));
        assert(!is_transient(ErrorCode::AssemblyFailed));
        assert(!is_transient(ErrorCode::InvalidChunk));

        assert(to_string(ErrorCode::StorageError) == "storage_error");
        assert(error_code_from_int(to_int(ErrorCode::SizeMismatch)) == ErrorCode::SizeMismatch);
    }

} // namespace

int main()
{
    try
    {
        test_request_envelope();
        test_response_envelope_error();
        test_begin_request_optional_fields();
        test_upload_chunk_wire_names();
        test_session_status_progress();
        test_framing();
        test_base64();
        test_crypto();
        test_chunk_layout();
        test_error_classification();
        run_server_component_tests();
        run_client_driver_tests();
        run_end_to_end_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
