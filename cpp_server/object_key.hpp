#ifndef OBJECT_KEY_HPP
#define OBJECT_KEY_HPP

#include <cstddef>
#include <string>

constexpr size_t kMaxObjectKeyLength = 1024;

// Returns an empty string when the key is acceptable, otherwise the reason.
std::string ObjectKeyProblem(const std::string& key);

// Throws StoreError(InvalidArgument) carrying the reason.
void ValidateObjectKey(const std::string& key);

// Last path component of a client-supplied filename ("a/b\\c.txt" -> "c.txt").
std::string KeyFromFilename(const std::string& filename);

// Explicit key wins; otherwise derive from the filename. Validates the result.
std::string ResolveUploadKey(const std::string& explicit_key, const std::string& filename);

#endif // OBJECT_KEY_HPP
