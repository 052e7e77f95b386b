#include "chunkwise/server/artifact_sink.hpp"

#include <spdlog/spdlog.h>

namespace chunkwise::server
{

    void LoggingArtifactSink::deliver(const AssembledArtifact &artifact)
    {
        spdlog::info("Upload complete: {} -> {} ({} bytes, blake2b {})", artifact.file_name,
                     artifact.final_path.string(), artifact.size_bytes, artifact.checksum.value_or("-"));
    }

} // namespace chunkwise::server
