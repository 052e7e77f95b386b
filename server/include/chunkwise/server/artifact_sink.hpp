#pragma once

#include "chunkwise/server/assembly_engine.hpp"

namespace chunkwise::server
{

    /// Receives every artifact once its assembly succeeded.
    class ArtifactSink
    {
    public:
        virtual ~ArtifactSink() = default;

        virtual void deliver(const AssembledArtifact &artifact) = 0;
    };

    class LoggingArtifactSink final : public ArtifactSink
    {
    public:
        void deliver(const AssembledArtifact &artifact) override;
    };

} // namespace chunkwise::server
