#include "chunkwise/server/assembly_engine.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkwise/crypto.hpp"
#include "chunkwise/server/chunk_store.hpp"
#include "chunkwise/server/upload_error.hpp"

namespace chunkwise::server
{

    AssemblyEngine::AssemblyEngine(const ChunkStore &store, AssemblyOptions options)
        : store_(store), options_(std::move(options))
    {
        std::filesystem::create_directories(options_.output_root);
    }

    std::filesystem::path AssemblyEngine::output_path_for(const SessionSnapshot &session) const
    {
        if (options_.per_session_directory)
        {
            return options_.output_root / session.session_id / session.parameters.file_name;
        }
        return options_.output_root / session.parameters.file_name;
    }

    AssembledArtifact AssemblyEngine::assemble(const SessionSnapshot &session) const
    {
        const auto final_path = output_path_for(session);
        auto temp_path = final_path;
        temp_path += "." + session.session_id + ".part";

        try
        {
            std::error_code ec;
            std::filesystem::create_directories(final_path.parent_path(), ec);
            if (ec)
            {
                throw UploadError(chunkwise::ErrorCode::StorageError,
                                  "Failed to create output directory: " + ec.message());
            }

            auto artifact = write_artifact(session, temp_path);

            std::filesystem::rename(temp_path, final_path, ec);
            if (ec)
            {
                throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to publish artifact: " + ec.message());
            }
            artifact.final_path = final_path;
            spdlog::info("Assembled {} ({} bytes) for session {}", final_path.string(), artifact.size_bytes,
                         session.session_id);
            return artifact;
        }
        catch (const UploadError &ex)
        {
            std::error_code cleanup;
            std::filesystem::remove(temp_path, cleanup);
            spdlog::error("Assembly of session {} failed: {}", session.session_id, ex.what());
            throw UploadError(chunkwise::ErrorCode::AssemblyFailed, ex.what(), ex.code());
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            std::error_code cleanup;
            std::filesystem::remove(temp_path, cleanup);
            spdlog::error("Assembly of session {} failed: {}", session.session_id, ex.what());
            throw UploadError(chunkwise::ErrorCode::AssemblyFailed, ex.what(), chunkwise::ErrorCode::StorageError);
        }
    }

    AssembledArtifact AssemblyEngine::write_artifact(const SessionSnapshot &session,
                                                     const std::filesystem::path &temp_path) const
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to open " + temp_path.string());
        }

        crypto::StreamingHash digest;
        std::uint64_t written = 0;
        auto chunks = store_.read_chunks_in_order(session.session_id, session.total_chunks);
        while (auto chunk = chunks->next())
        {
            out.write(reinterpret_cast<const char *>(chunk->data()), static_cast<std::streamsize>(chunk->size()));
            if (!out)
            {
                throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to write " + temp_path.string());
            }
            digest.update(*chunk);
            written += chunk->size();
        }
        out.flush();
        out.close();
        if (!out)
        {
            throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to flush " + temp_path.string());
        }

        if (written != session.parameters.total_size)
        {
            throw UploadError(chunkwise::ErrorCode::SizeMismatch,
                              "Assembled " + std::to_string(written) + " bytes, expected " +
                                  std::to_string(session.parameters.total_size));
        }

        auto checksum = digest.finish();
        const auto &expected = session.parameters.checksum;
        if (options_.verify_checksum && expected && *expected != checksum)
        {
            throw UploadError(chunkwise::ErrorCode::ChecksumMismatch, "Assembled file checksum does not match");
        }

        return AssembledArtifact{
            .session_id = session.session_id,
            .file_name = session.parameters.file_name,
            .final_path = {},
            .size_bytes = written,
            .checksum = std::move(checksum),
        };
    }

} // namespace chunkwise::server
