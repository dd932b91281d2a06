#include "fluxdb/core/error.h"

namespace fluxdb {
namespace core {

const char* CodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case Error::Code::TIMEOUT: return "TIMEOUT";
        case Error::Code::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::IO_FAILURE: return "IO_FAILURE";
        case Error::Code::AUTHORIZATION_DENIED: return "AUTHORIZATION_DENIED";
        case Error::Code::INVALID_STATEMENT: return "INVALID_STATEMENT";
        case Error::Code::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace fluxdb
