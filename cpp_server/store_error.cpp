#include "store_error.hpp"

StoreError::StoreError(StoreErrorKind kind, const std::string& detail, const std::string& public_message)
    : std::runtime_error(detail), kind_(kind),
      public_message_(public_message.empty() ? GenericMessage(kind) : public_message) {}

const char* KindName(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::NotFound: return "not-found";
        case StoreErrorKind::InvalidArgument: return "invalid-argument";
        case StoreErrorKind::AccessDenied: return "access-denied";
        case StoreErrorKind::Unavailable: return "unavailable";
        case StoreErrorKind::Internal: return "internal";
    }
    return "internal";
}

const char* GenericMessage(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::NotFound: return "File not found";
        case StoreErrorKind::InvalidArgument: return "Invalid request";
        case StoreErrorKind::AccessDenied: return "Storage rejected the bridge credentials";
        case StoreErrorKind::Unavailable: return "Storage unavailable";
        case StoreErrorKind::Internal: return "Internal error";
    }
    return "Internal error";
}

int HttpStatusFor(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::NotFound: return 404;
        case StoreErrorKind::InvalidArgument: return 400;
        case StoreErrorKind::AccessDenied: return 502;
        case StoreErrorKind::Unavailable: return 503;
        case StoreErrorKind::Internal: return 500;
    }
    return 500;
}

StoreErrorKind ClassifyS3Error(long http_status, const std::string& s3_code) {
    if (s3_code == "NoSuchKey" || s3_code == "NoSuchUpload") {
        return StoreErrorKind::NotFound;
    }
    // The configured bucket is gone: the store is not provisioned, not the object missing.
    if (s3_code == "NoSuchBucket") return StoreErrorKind::Unavailable;
    if (s3_code == "AccessDenied" || s3_code == "InvalidAccessKeyId" ||
        s3_code == "SignatureDoesNotMatch" || s3_code == "RequestTimeTooSkewed") {
        return StoreErrorKind::AccessDenied;
    }
    if (s3_code == "SlowDown" || s3_code == "ServiceUnavailable" || s3_code == "InternalError" ||
        s3_code == "XMinioServerNotInitialized") {
        return StoreErrorKind::Unavailable;
    }
    if (s3_code == "InvalidArgument" || s3_code == "InvalidRange" || s3_code == "EntityTooLarge" ||
        s3_code == "KeyTooLongError" || s3_code == "InvalidObjectName" || s3_code == "EntityTooSmall" ||
        s3_code == "InvalidPart" || s3_code == "InvalidPartOrder") {
        return StoreErrorKind::InvalidArgument;
    }

    if (http_status == 404) return StoreErrorKind::NotFound;
    if (http_status == 401 || http_status == 403) return StoreErrorKind::AccessDenied;
    if (http_status == 400 || http_status == 411 || http_status == 416) return StoreErrorKind::InvalidArgument;
    if (http_status >= 500 || http_status == 0) return StoreErrorKind::Unavailable;
    return StoreErrorKind::Internal;
}
