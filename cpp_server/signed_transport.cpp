#include "signed_transport.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <exception>
#include <stdexcept>

namespace {

struct UploadCursor {
    const std::string* data;
    size_t offset;
};

struct ReceiveContext {
    CURL* handle;
    TransportResponse* response;
    const ChunkSink* sink;
    std::exception_ptr failure;
};

size_t ReadCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* cursor = static_cast<UploadCursor*>(userdata);
    size_t remaining = cursor->data->size() - cursor->offset;
    size_t count = std::min(size * nmemb, remaining);
    if (count > 0) {
        std::copy_n(cursor->data->data() + cursor->offset, count, ptr);
        cursor->offset += count;
    }
    return count;
}

size_t ReceiveCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ReceiveContext*>(userdata);
    size_t total = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
    if (ctx->sink != nullptr && *ctx->sink && status / 100 == 2) {
        // Exceptions must not unwind through libcurl.
        try {
            if (!(*ctx->sink)(ptr, total)) {
                ctx->response->cancelled = true;
                return 0;
            }
        } catch (...) {
            ctx->failure = std::current_exception();
            return 0;
        }
        return total;
    }

    ctx->response->body.append(ptr, total);
    return total;
}

size_t HeaderCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<TransportResponse*>(userdata);
    size_t total = size * nmemb;
    std::string line(ptr, total);

    // A new status line (after 100 Continue or a redirect) starts a fresh header set.
    if (line.rfind("HTTP/", 0) == 0) {
        response->headers.clear();
        return total;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) return total;

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });

    size_t value_start = line.find_first_not_of(" \t", colon + 1);
    size_t value_end = line.find_last_not_of(" \t\r\n");
    std::string value;
    if (value_start != std::string::npos && value_end != std::string::npos && value_end >= value_start) {
        value = line.substr(value_start, value_end - value_start + 1);
    }
    response->headers[name] = value;
    return total;
}

} // namespace

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
    if (!handle_) throw std::runtime_error("curl_easy_init failed");
    curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
}

CurlEasy::~CurlEasy() {
    curl_easy_cleanup(handle_);
}

std::string TransportResponse::Header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

SignedTransport::SignedTransport(const std::string& endpoint, const SigningCredentials& creds,
                                 long connect_timeout_ms, long request_timeout_ms)
    : endpoint_(ParseEndpoint(endpoint)), creds_(creds),
      connect_timeout_ms_(connect_timeout_ms), request_timeout_ms_(request_timeout_ms), share_(nullptr) {
    EnsureCurlGlobalInit();

    share_ = curl_share_init();
    if (!share_) throw std::runtime_error("curl_share_init failed");
    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &SignedTransport::LockShare);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &SignedTransport::UnlockShare);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
}

SignedTransport::~SignedTransport() {
    curl_share_cleanup(share_);
}

void SignedTransport::LockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    static_cast<SignedTransport*>(userptr)->share_locks_[data].lock();
}

void SignedTransport::UnlockShare(CURL*, curl_lock_data data, void* userptr) {
    static_cast<SignedTransport*>(userptr)->share_locks_[data].unlock();
}

TransportResponse SignedTransport::Execute(const TransportRequest& request) const {
    CurlEasy handle;

    std::string amz_date = AmzDate(std::time(nullptr));
    std::string payload_hash = Sha256Hex(request.body);

    std::map<std::string, std::string> signed_headers = request.headers;
    signed_headers["host"] = endpoint_.host;
    signed_headers["x-amz-date"] = amz_date;
    signed_headers["x-amz-content-sha256"] = payload_hash;

    std::string auth = BuildAuthorizationHeader(creds_, request.method, request.path, request.query,
                                                signed_headers, payload_hash, amz_date);

    HeaderList headers;
    for (const auto& header : signed_headers) {
        headers.Add(header.first + ": " + header.second);
    }
    headers.Add("Authorization: " + auth);
    headers.Add("Expect:");

    std::string url = endpoint_.BaseUrl() + request.path;
    std::string query = CanonicalQuery(request.query);
    if (!query.empty()) url += "?" + query;

    TransportResponse response;
    ReceiveContext receive{handle, &response, &request.on_data, nullptr};
    UploadCursor cursor{&request.body, 0};

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_SHARE, share_);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.Get());
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, ReceiveCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &receive);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response);

    if (request.on_data) {
        // Streams may legitimately run longer than any fixed deadline; give up only when stalled.
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, std::max(1L, request_timeout_ms_ / 1000));
    } else {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, request_timeout_ms_);
    }

    if (request.method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else if (request.method == "PUT" || request.method == "POST") {
        curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle, CURLOPT_READFUNCTION, ReadCallback);
        curl_easy_setopt(handle, CURLOPT_READDATA, &cursor);
        curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    } else if (request.method != "GET") {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    response.curl = curl_easy_perform(handle);
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);

    if (receive.failure) std::rethrow_exception(receive.failure);
    return response;
}
