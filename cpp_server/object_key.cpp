#include "object_key.hpp"
#include "store_error.hpp"

std::string ObjectKeyProblem(const std::string& key) {
    if (key.empty()) return "Object key must not be empty";
    if (key.size() > kMaxObjectKeyLength) return "Object key exceeds 1024 bytes";
    if (key.front() == '/') return "Object key must not start with '/'";

    for (unsigned char c : key) {
        if (c < 0x20 || c == 0x7F) return "Object key contains control characters";
    }

    size_t start = 0;
    while (start <= key.size()) {
        size_t end = key.find('/', start);
        if (end == std::string::npos) end = key.size();
        std::string segment = key.substr(start, end - start);
        if (segment == "." || segment == "..") return "Object key must not contain '.' or '..' segments";
        start = end + 1;
    }

    // GET /files/{key}/metadata would shadow the download route for such keys.
    static const std::string kMetadataSuffix = "/metadata";
    if (key.size() > kMetadataSuffix.size() &&
        key.compare(key.size() - kMetadataSuffix.size(), kMetadataSuffix.size(), kMetadataSuffix) == 0) {
        return "Object key must not end with '/metadata'";
    }
    return "";
}

void ValidateObjectKey(const std::string& key) {
    std::string problem = ObjectKeyProblem(key);
    if (!problem.empty()) {
        throw StoreError(StoreErrorKind::InvalidArgument, problem + ": " + key, problem);
    }
}

std::string KeyFromFilename(const std::string& filename) {
    size_t slash = filename.find_last_of("/\\");
    if (slash == std::string::npos) return filename;
    return filename.substr(slash + 1);
}

std::string ResolveUploadKey(const std::string& explicit_key, const std::string& filename) {
    std::string key = explicit_key.empty() ? KeyFromFilename(filename) : explicit_key;
    if (key.empty()) {
        throw StoreError(StoreErrorKind::InvalidArgument, "Upload without key or filename",
                         "No filename provided and no key specified");
    }
    ValidateObjectKey(key);
    return key;
}
