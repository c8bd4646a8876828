#ifndef SIGNED_TRANSPORT_HPP
#define SIGNED_TRANSPORT_HPP

#include <array>
#include <map>
#include <mutex>
#include <string>
#include <curl/curl.h>
#include "object_store.hpp"
#include "sigv4.hpp"

void EnsureCurlGlobalInit();

// RAII easy handle with the defaults every store request shares.
class CurlEasy {
public:
    CurlEasy();
    ~CurlEasy();
    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*() const { return handle_; }

private:
    CURL* handle_;
};

class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() { curl_slist_free_all(head_); }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void Add(const std::string& line) { head_ = curl_slist_append(head_, line.c_str()); }
    curl_slist* Get() const { return head_; }

private:
    curl_slist* head_ = nullptr;
};

struct TransportRequest {
    std::string method = "GET";
    std::string path = "/";                      // already URI-encoded
    std::map<std::string, std::string> query;    // raw names and values
    std::map<std::string, std::string> headers;  // lowercase names, all signed
    std::string body;
    ChunkSink on_data;                            // receives 2xx bodies instead of buffering them
};

struct TransportResponse {
    CURLcode curl = CURLE_OK;
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers; // lowercase names
    bool cancelled = false;                     // on_data returned false

    bool Ok() const { return curl == CURLE_OK && status / 100 == 2; }
    std::string Header(const std::string& name) const;
};

// Signs and performs requests against one S3-compatible endpoint with one
// identity. Safe for concurrent use: every call gets its own easy handle and
// connections are shared through a locked CURLSH cache.
class SignedTransport {
public:
    SignedTransport(const std::string& endpoint, const SigningCredentials& creds,
                    long connect_timeout_ms, long request_timeout_ms);
    ~SignedTransport();
    SignedTransport(const SignedTransport&) = delete;
    SignedTransport& operator=(const SignedTransport&) = delete;

    TransportResponse Execute(const TransportRequest& request) const;

    const StoreEndpoint& Endpoint() const { return endpoint_; }

private:
    StoreEndpoint endpoint_;
    SigningCredentials creds_;
    long connect_timeout_ms_;
    long request_timeout_ms_;
    CURLSH* share_;
    mutable std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks_;

    static void LockShare(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void UnlockShare(CURL* handle, curl_lock_data data, void* userptr);
};

#endif // SIGNED_TRANSPORT_HPP
