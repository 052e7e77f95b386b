#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunkwise/server/session_tracker.hpp"

namespace chunkwise::server
{

    class ChunkStore;

    struct AssemblyOptions
    {
        std::filesystem::path output_root;
        /// Place artifacts under `<output_root>/<session_id>/`.
        bool per_session_directory{true};
        bool verify_checksum{true};
    };

    struct AssembledArtifact
    {
        std::string session_id;
        std::string file_name;
        std::filesystem::path final_path;
        std::uint64_t size_bytes{};
        /// BLAKE2b digest of the assembled bytes.
        std::optional<std::string> checksum;
    };

    /**
     * Merges the chunks of a complete session into its final file.
     *
     * The caller must hold the session's assembly claim. On failure the partial
     * output is removed, the stored chunks are left untouched and an
     * UploadError(AssemblyFailed) carrying the detailed cause is thrown.
     */
    class AssemblyEngine
    {
    public:
        AssemblyEngine(const ChunkStore &store, AssemblyOptions options);

        AssembledArtifact assemble(const SessionSnapshot &session) const;

        std::filesystem::path output_path_for(const SessionSnapshot &session) const;

    private:
        AssembledArtifact write_artifact(const SessionSnapshot &session, const std::filesystem::path &temp_path) const;

        const ChunkStore &store_;
        AssemblyOptions options_;
    };

} // namespace chunkwise::server
