#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

struct ObjectInfo {
    std::string key;
    uint64_t content_length = 0;
    std::string content_type;
    std::string etag;
    std::string last_modified; // ISO-8601 UTC, empty when the store did not report it
};

// Receives downloaded bytes; returning false cancels the transfer.
using ChunkSink = std::function<bool(const char* data, size_t length)>;

// One in-flight upload. Destroying an uncommitted stream aborts it.
class UploadStream {
public:
    virtual ~UploadStream() = default;

    virtual void Write(const char* data, size_t length) = 0;
    virtual ObjectInfo Commit() = 0;
    virtual void Abort() noexcept = 0;
};

// Every method may throw StoreError; nothing else escapes an implementation.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual std::unique_ptr<UploadStream> BeginUpload(const std::string& key, const std::string& content_type) = 0;

    virtual ObjectInfo Stat(const std::string& key) = 0;

    // Streams `length` bytes starting at `offset` into `sink`; a length of 0 reads
    // through the end of the object. Returns false if the sink cancelled.
    virtual bool Read(const std::string& key, uint64_t offset, uint64_t length, const ChunkSink& sink) = 0;

    // Succeeds whether or not the key existed.
    virtual void Remove(const std::string& key) = 0;

    // True when the bucket answers a cheap request. Never throws.
    virtual bool Ping() = 0;
};

#endif // OBJECT_STORE_HPP
