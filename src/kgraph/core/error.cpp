#include "kgraph/core/error.h"

namespace kgraph {
namespace core {

const char* ToString(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "Unknown";
        case Error::Code::INVALID_ARGUMENT: return "InvalidArgument";
        case Error::Code::NOT_FOUND: return "NotFound";
        case Error::Code::INTERNAL: return "Internal";
        case Error::Code::NOT_INITIALIZED: return "NotInitialized";
        case Error::Code::STORAGE_UNAVAILABLE: return "StorageUnavailable";
        case Error::Code::ENCODING_ERROR: return "EncodingError";
        case Error::Code::DIMENSION_MISMATCH: return "DimensionMismatch";
        case Error::Code::ORACLE_FAILURE: return "OracleFailure";
        case Error::Code::ABORTED: return "Aborted";
    }
    return "Unknown";
}

} // namespace core
} // namespace kgraph
