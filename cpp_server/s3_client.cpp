#include "s3_client.hpp"
#include "logger.hpp"
#include "s3_wire.hpp"
#include <algorithm>

namespace {

// Buffers at most one part. Small objects become a single PutObject; larger
// ones switch to a multipart upload as soon as the first part is full.
class S3UploadStream : public UploadStream {
public:
    S3UploadStream(S3Client& client, const std::string& key, const std::string& content_type)
        : client_(client), key_(key), content_type_(content_type) {}

    ~S3UploadStream() override {
        if (!finished_) Abort();
    }

    void Write(const char* data, size_t length) override {
        if (finished_) {
            throw StoreError(StoreErrorKind::Internal, "Write on a finished upload of " + key_);
        }
        total_ += length;
        while (length > 0) {
            // Only flush when more bytes follow, so the last part is never empty.
            if (buffer_.size() == client_.PartSize()) FlushPart();
            size_t take = std::min<uint64_t>(client_.PartSize() - buffer_.size(), length);
            buffer_.append(data, take);
            data += take;
            length -= take;
        }
    }

    ObjectInfo Commit() override {
        if (finished_) {
            throw StoreError(StoreErrorKind::Internal, "Commit on a finished upload of " + key_);
        }

        ObjectInfo info;
        if (upload_id_.empty()) {
            info = client_.PutObject(key_, content_type_, buffer_);
        } else {
            if (!buffer_.empty()) FlushPart();
            info.key = key_;
            info.etag = client_.CompleteMultipartUpload(key_, upload_id_, etags_);
            Logger::Info("Completed multipart upload of " + key_ + " in " + std::to_string(etags_.size()) + " parts", "S3");
        }
        finished_ = true;
        std::string().swap(buffer_);

        info.key = key_;
        info.content_type = content_type_;
        info.content_length = total_;
        return info;
    }

    void Abort() noexcept override {
        if (finished_) return;
        finished_ = true;
        std::string().swap(buffer_);
        if (upload_id_.empty()) return;

        try {
            client_.AbortMultipartUpload(key_, upload_id_);
            Logger::Warn("Aborted multipart upload of " + key_, "S3");
        } catch (const std::exception& e) {
            Logger::Error("Failed to abort multipart upload " + upload_id_ + " of " + key_ + ": " + e.what(), "S3");
        }
    }

private:
    S3Client& client_;
    std::string key_;
    std::string content_type_;
    std::string buffer_;
    std::string upload_id_;
    std::vector<std::string> etags_;
    uint64_t total_ = 0;
    bool finished_ = false;

    void FlushPart() {
        if (upload_id_.empty()) {
            upload_id_ = client_.CreateMultipartUpload(key_, content_type_);
        }
        int part_number = static_cast<int>(etags_.size()) + 1;
        etags_.push_back(client_.UploadPart(key_, upload_id_, part_number, buffer_));
        buffer_.clear();
    }
};

uint64_t ParseLength(const std::string& value) {
    if (value.empty()) return 0;
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

S3Client::S3Client(const Config::ServerConfig& config)
    : bucket_(config.s3_bucket),
      part_size_(config.s3_part_size),
      transport_(config.s3_endpoint,
                 SigningCredentials{config.s3_access_key, config.s3_secret_key, config.s3_region, "s3"},
                 config.s3_connect_timeout_ms, config.s3_request_timeout_ms) {}

TransportResponse S3Client::Send(const TransportRequest& request) const {
    try {
        return transport_.Execute(request);
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(StoreErrorKind::Internal, std::string("S3 transport failure: ") + e.what());
    }
}

StoreError S3Client::ErrorFrom(const std::string& operation, const std::string& key,
                               const TransportResponse& response) const {
    if (response.curl != CURLE_OK) {
        return StoreError(StoreErrorKind::Unavailable,
                          "S3 " + operation + " " + key + " failed: " + curl_easy_strerror(response.curl));
    }

    std::string code = ExtractXmlValue(response.body, "Code");
    if (code.empty()) code = response.Header("x-minio-error-code");
    StoreErrorKind kind = ClassifyS3Error(response.status, code);
    std::string detail = "S3 " + operation + " " + key + " failed: HTTP " + std::to_string(response.status);
    if (!code.empty()) detail += " " + code;
    return StoreError(kind, detail);
}

bool S3Client::BucketMissing() const {
    TransportRequest request;
    request.method = "HEAD";
    request.path = "/" + UriEncode(bucket_, true);

    try {
        TransportResponse response = Send(request);
        return response.curl == CURLE_OK && response.status == 404;
    } catch (const StoreError& e) {
        Logger::Warn(std::string("Bucket existence check failed: ") + e.what(), "S3");
        return false;
    }
}

std::unique_ptr<UploadStream> S3Client::BeginUpload(const std::string& key, const std::string& content_type) {
    return std::make_unique<S3UploadStream>(*this, key, content_type);
}

ObjectInfo S3Client::PutObject(const std::string& key, const std::string& content_type, const std::string& data) {
    TransportRequest request;
    request.method = "PUT";
    request.path = ObjectPath(bucket_, key);
    request.headers["content-type"] = content_type;
    request.body = data;

    TransportResponse response = Send(request);
    if (!response.Ok()) throw ErrorFrom("PutObject", key, response);

    ObjectInfo info;
    info.key = key;
    info.etag = response.Header("etag");
    return info;
}

std::string S3Client::CreateMultipartUpload(const std::string& key, const std::string& content_type) {
    TransportRequest request;
    request.method = "POST";
    request.path = ObjectPath(bucket_, key);
    request.query["uploads"] = "";
    request.headers["content-type"] = content_type;

    TransportResponse response = Send(request);
    if (!response.Ok()) throw ErrorFrom("CreateMultipartUpload", key, response);

    std::string upload_id = ExtractXmlValue(response.body, "UploadId");
    if (upload_id.empty()) {
        throw StoreError(StoreErrorKind::Internal, "S3 CreateMultipartUpload " + key + " returned no UploadId");
    }
    return upload_id;
}

std::string S3Client::UploadPart(const std::string& key, const std::string& upload_id, int part_number,
                                 const std::string& data) {
    TransportRequest request;
    request.method = "PUT";
    request.path = ObjectPath(bucket_, key);
    request.query["partNumber"] = std::to_string(part_number);
    request.query["uploadId"] = upload_id;
    request.body = data;

    TransportResponse response = Send(request);
    if (!response.Ok()) throw ErrorFrom("UploadPart", key, response);

    std::string etag = response.Header("etag");
    if (etag.empty()) {
        throw StoreError(StoreErrorKind::Internal, "S3 UploadPart " + key + " returned no ETag");
    }
    Logger::Debug("Uploaded part " + std::to_string(part_number) + " of " + key, "S3");
    return etag;
}

std::string S3Client::CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                              const std::vector<std::string>& etags) {
    TransportRequest request;
    request.method = "POST";
    request.path = ObjectPath(bucket_, key);
    request.query["uploadId"] = upload_id;
    request.headers["content-type"] = "application/xml";
    request.body = BuildCompleteMultipartXml(etags);

    TransportResponse response = Send(request);
    // S3 may report a failed completion inside a 200 response.
    if (!response.Ok() || response.body.find("<Error>") != std::string::npos) {
        if (response.Ok()) response.status = 500;
        throw ErrorFrom("CompleteMultipartUpload", key, response);
    }
    return ExtractXmlValue(response.body, "ETag");
}

void S3Client::AbortMultipartUpload(const std::string& key, const std::string& upload_id) {
    TransportRequest request;
    request.method = "DELETE";
    request.path = ObjectPath(bucket_, key);
    request.query["uploadId"] = upload_id;

    TransportResponse response = Send(request);
    if (response.Ok()) return;

    StoreError error = ErrorFrom("AbortMultipartUpload", key, response);
    if (error.Kind() != StoreErrorKind::NotFound) throw error;
}

ObjectInfo S3Client::Stat(const std::string& key) {
    TransportRequest request;
    request.method = "HEAD";
    request.path = ObjectPath(bucket_, key);

    TransportResponse response = Send(request);
    if (!response.Ok()) {
        StoreError error = ErrorFrom("HeadObject", key, response);
        if (error.Kind() == StoreErrorKind::NotFound && BucketMissing()) {
            throw StoreError(StoreErrorKind::Unavailable, "S3 HeadObject " + key + " failed: bucket " + bucket_ +
                                                              " does not exist");
        }
        throw error;
    }

    ObjectInfo info;
    info.key = key;
    info.content_length = ParseLength(response.Header("content-length"));
    info.content_type = response.Header("content-type");
    if (info.content_type.empty()) info.content_type = "application/octet-stream";
    info.etag = response.Header("etag");
    std::string last_modified = response.Header("last-modified");
    if (!last_modified.empty()) info.last_modified = HttpDateToIso8601(last_modified);
    return info;
}

bool S3Client::Read(const std::string& key, uint64_t offset, uint64_t length, const ChunkSink& sink) {
    TransportRequest request;
    request.method = "GET";
    request.path = ObjectPath(bucket_, key);
    if (length > 0) {
        request.headers["range"] = "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
    } else if (offset > 0) {
        request.headers["range"] = "bytes=" + std::to_string(offset) + "-";
    }

    // Never hand the sink more than was asked for, even if the store ignores the range.
    uint64_t remaining = length;
    request.on_data = [&sink, &remaining, length](const char* data, size_t size) {
        if (length == 0) return sink(data, size);
        if (remaining == 0) return true;
        size_t take = static_cast<size_t>(std::min<uint64_t>(remaining, size));
        remaining -= take;
        return sink(data, take);
    };

    TransportResponse response = Send(request);
    if (response.cancelled) return false;
    if (!response.Ok()) throw ErrorFrom("GetObject", key, response);
    return true;
}

void S3Client::Remove(const std::string& key) {
    TransportRequest request;
    request.method = "DELETE";
    request.path = ObjectPath(bucket_, key);

    TransportResponse response = Send(request);
    if (response.Ok()) return;

    StoreError error = ErrorFrom("DeleteObject", key, response);
    if (error.Kind() != StoreErrorKind::NotFound) throw error;
    if (BucketMissing()) {
        throw StoreError(StoreErrorKind::Unavailable, "S3 DeleteObject " + key + " failed: bucket " + bucket_ +
                                                          " does not exist");
    }
}

bool S3Client::Ping() {
    TransportRequest request;
    request.method = "GET";
    request.path = "/" + UriEncode(bucket_, true);
    request.query["list-type"] = "2";
    request.query["max-keys"] = "1";

    try {
        TransportResponse response = Send(request);
        if (response.Ok()) return true;
        Logger::Warn(ErrorFrom("ListObjectsV2", bucket_, response).what(), "S3");
    } catch (const std::exception& e) {
        Logger::Warn(std::string("Health probe failed: ") + e.what(), "S3");
    }
    return false;
}
