#ifndef STORE_ERROR_HPP
#define STORE_ERROR_HPP

#include <stdexcept>
#include <string>

// The only error categories that cross from the store client into HTTP responses.
enum class StoreErrorKind {
    NotFound,
    InvalidArgument,
    AccessDenied,
    Unavailable,
    Internal
};

class StoreError : public std::runtime_error {
public:
    // `detail` is for logs; `public_message` is what a client may see and
    // defaults to a generic text for the kind.
    StoreError(StoreErrorKind kind, const std::string& detail, const std::string& public_message = "");

    StoreErrorKind Kind() const { return kind_; }
    const std::string& PublicMessage() const { return public_message_; }

private:
    StoreErrorKind kind_;
    std::string public_message_;
};

const char* KindName(StoreErrorKind kind);
const char* GenericMessage(StoreErrorKind kind);
int HttpStatusFor(StoreErrorKind kind);

// Maps an S3 error code (may be empty) and HTTP status into the taxonomy.
StoreErrorKind ClassifyS3Error(long http_status, const std::string& s3_code);

#endif // STORE_ERROR_HPP
