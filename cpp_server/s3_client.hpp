#ifndef S3_CLIENT_HPP
#define S3_CLIENT_HPP

#include <string>
#include <vector>
#include "config.hpp"
#include "object_store.hpp"
#include "signed_transport.hpp"
#include "store_error.hpp"

// ObjectStore over the S3 REST API (path-style addressing, SigV4 headers),
// authenticated as the application identity.
class S3Client : public ObjectStore {
public:
    explicit S3Client(const Config::ServerConfig& config);

    std::unique_ptr<UploadStream> BeginUpload(const std::string& key, const std::string& content_type) override;
    ObjectInfo Stat(const std::string& key) override;
    bool Read(const std::string& key, uint64_t offset, uint64_t length, const ChunkSink& sink) override;
    void Remove(const std::string& key) override;
    bool Ping() override;

    // Single-request upload; used while the whole object fits in one part.
    ObjectInfo PutObject(const std::string& key, const std::string& content_type, const std::string& data);

    std::string CreateMultipartUpload(const std::string& key, const std::string& content_type);
    // Returns the part's ETag.
    std::string UploadPart(const std::string& key, const std::string& upload_id, int part_number, const std::string& data);
    // Returns the object's ETag.
    std::string CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                        const std::vector<std::string>& etags);
    void AbortMultipartUpload(const std::string& key, const std::string& upload_id);

    uint64_t PartSize() const { return part_size_; }

private:
    std::string bucket_;
    uint64_t part_size_;
    SignedTransport transport_;

    TransportResponse Send(const TransportRequest& request) const;
    StoreError ErrorFrom(const std::string& operation, const std::string& key, const TransportResponse& response) const;
    // Only called after a bodiless 404, which S3 sends for a missing key and a missing bucket alike.
    bool BucketMissing() const;
};

#endif // S3_CLIENT_HPP
