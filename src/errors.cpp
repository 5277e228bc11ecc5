#include "errors.hpp"

std::string_view errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::InvalidConfiguration:
        return "InvalidConfiguration";
    case ErrorKind::InvalidCredential:
        return "InvalidCredential";
    case ErrorKind::AuthenticationFailed:
        return "AuthenticationFailed";
    case ErrorKind::ProtocolOrHostError:
        return "ProtocolOrHostError";
    case ErrorKind::HostUnreachable:
        return "HostUnreachable";
    case ErrorKind::RemotePathNotFound:
        return "RemotePathNotFound";
    case ErrorKind::RemotePermissionDenied:
        return "RemotePermissionDenied";
    case ErrorKind::Unclassified:
        break;
    }
    return "Unclassified";
}

bool isUserError(ErrorKind kind) noexcept {
    return kind != ErrorKind::Unclassified;
}

int exitCodeFor(ErrorKind kind) noexcept {
    return isUserError(kind) ? 1 : 2;
}
