#include <gtest/gtest.h>
#include "object_key.hpp"
#include "store_error.hpp"

TEST(ObjectKeyTest, AcceptsOrdinaryKeys) {
    EXPECT_EQ(ObjectKeyProblem("hello.txt"), "");
    EXPECT_EQ(ObjectKeyProblem("reports/2024/q1 summary.pdf"), "");
    EXPECT_EQ(ObjectKeyProblem("caf\xC3\xA9.txt"), "");
    EXPECT_EQ(ObjectKeyProblem(".hidden"), "");
    EXPECT_EQ(ObjectKeyProblem(std::string(kMaxObjectKeyLength, 'k')), "");
}

TEST(ObjectKeyTest, RejectsMalformedKeys) {
    EXPECT_NE(ObjectKeyProblem(""), "");
    EXPECT_NE(ObjectKeyProblem(std::string(kMaxObjectKeyLength + 1, 'k')), "");
    EXPECT_NE(ObjectKeyProblem("/absolute"), "");
    EXPECT_NE(ObjectKeyProblem("tab\there"), "");
    EXPECT_NE(ObjectKeyProblem(std::string("nul\0byte", 8)), "");
    EXPECT_NE(ObjectKeyProblem("a/../b"), "");
    EXPECT_NE(ObjectKeyProblem("./a"), "");
    EXPECT_NE(ObjectKeyProblem(".."), "");
}

TEST(ObjectKeyTest, RejectsKeysShadowedByMetadataRoute) {
    EXPECT_EQ(ObjectKeyProblem("reports/metadata"), "Object key must not end with '/metadata'");
    EXPECT_EQ(ObjectKeyProblem("metadata"), "");
    EXPECT_EQ(ObjectKeyProblem("reports/metadata.json"), "");
}

TEST(ObjectKeyTest, ValidateThrowsInvalidArgumentWithReason) {
    try {
        ValidateObjectKey("../etc/passwd");
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), StoreErrorKind::InvalidArgument);
        EXPECT_EQ(e.PublicMessage(), "Object key must not contain '.' or '..' segments");
    }
}

TEST(ObjectKeyTest, KeyFromFilenameTakesBasename) {
    EXPECT_EQ(KeyFromFilename("hello.txt"), "hello.txt");
    EXPECT_EQ(KeyFromFilename("dir/sub/hello.txt"), "hello.txt");
    EXPECT_EQ(KeyFromFilename("C:\\Users\\me\\hello.txt"), "hello.txt");
    EXPECT_EQ(KeyFromFilename("dir/"), "");
}

TEST(ObjectKeyTest, ResolveUploadKeyPrefersExplicitKey) {
    EXPECT_EQ(ResolveUploadKey("custom/name.bin", "hello.txt"), "custom/name.bin");
    EXPECT_EQ(ResolveUploadKey("", "path/to/hello.txt"), "hello.txt");
}

TEST(ObjectKeyTest, ResolveUploadKeyRejectsMissingNames) {
    try {
        ResolveUploadKey("", "");
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), StoreErrorKind::InvalidArgument);
        EXPECT_EQ(e.PublicMessage(), "No filename provided and no key specified");
    }
    EXPECT_THROW(ResolveUploadKey("", ".."), StoreError);
    EXPECT_THROW(ResolveUploadKey("/abs", "hello.txt"), StoreError);
}
