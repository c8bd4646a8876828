#include <gtest/gtest.h>
#include "s3_wire.hpp"

TEST(S3WireTest, ExtractsFirstMatchingElement) {
    std::string xml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<Error><Code>NoSuchKey</Code><Message>The specified key does not exist.</Message>"
        "<Key>a&amp;b.txt</Key></Error>";

    EXPECT_EQ(ExtractXmlValue(xml, "Code"), "NoSuchKey");
    EXPECT_EQ(ExtractXmlValue(xml, "Key"), "a&b.txt");
    EXPECT_EQ(ExtractXmlValue(xml, "UploadId"), "");
    EXPECT_EQ(ExtractXmlValue("", "Code"), "");
}

TEST(S3WireTest, EscapesAndUnescapesEntities) {
    EXPECT_EQ(XmlEscape("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
    EXPECT_EQ(XmlUnescape("&quot;abc&quot; &amp;amp;"), "\"abc\" &amp;");
    EXPECT_EQ(XmlUnescape("plain & text"), "plain & text");
}

TEST(S3WireTest, CompleteMultipartBodyNumbersPartsFromOne) {
    std::string xml = BuildCompleteMultipartXml({"\"e1\"", "\"e2\""});
    EXPECT_EQ(xml,
              "<CompleteMultipartUpload>"
              "<Part><PartNumber>1</PartNumber><ETag>&quot;e1&quot;</ETag></Part>"
              "<Part><PartNumber>2</PartNumber><ETag>&quot;e2&quot;</ETag></Part>"
              "</CompleteMultipartUpload>");
}

TEST(S3WireTest, ConvertsHttpDates) {
    EXPECT_EQ(HttpDateToIso8601("Wed, 21 Oct 2015 07:28:00 GMT"), "2015-10-21T07:28:00Z");
    EXPECT_EQ(HttpDateToIso8601("not a date"), "not a date");
    EXPECT_EQ(EpochToIso8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(EpochToIso8601(1369353600), "2013-05-24T00:00:00Z");
}
