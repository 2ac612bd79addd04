#include "gidkit/core/errors.hpp"

namespace gidkit::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::OutOfMemory: return "OutOfMemory";
            case StatusCode::InvalidMachineTag: return "InvalidMachineTag";
            case StatusCode::MissingPrefix: return "MissingPrefix";
            case StatusCode::MalformedBody: return "MalformedBody";
            case StatusCode::UnknownEntityType: return "UnknownEntityType";
            case StatusCode::InvalidId: return "InvalidId";
            case StatusCode::InvalidEncoding: return "InvalidEncoding";
            case StatusCode::InvalidCursor: return "InvalidCursor";
            case StatusCode::InvalidLimit: return "InvalidLimit";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Ids: return "Ids";
            case StatusDomain::Gid: return "Gid";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Cursor: return "Cursor";
            case StatusDomain::Paging: return "Paging";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace gidkit::core
