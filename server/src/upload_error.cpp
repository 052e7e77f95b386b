#include "chunkwise/server/upload_error.hpp"

namespace chunkwise::server
{

    UploadError::UploadError(chunkwise::ErrorCode code, std::string message,
                             std::optional<chunkwise::ErrorCode> cause)
        : std::runtime_error(std::move(message)), code_(code), cause_(cause)
    {
    }

} // namespace chunkwise::server
