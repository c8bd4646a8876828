#ifndef S3_WIRE_HPP
#define S3_WIRE_HPP

#include <string>
#include <vector>

// First <tag>value</tag> in an S3 XML document, unescaped. Empty when absent.
std::string ExtractXmlValue(const std::string& xml, const std::string& tag);

std::string XmlEscape(const std::string& text);
std::string XmlUnescape(const std::string& text);

// Body for CompleteMultipartUpload; part numbers start at 1 in vector order.
std::string BuildCompleteMultipartXml(const std::vector<std::string>& etags);

// "Wed, 21 Oct 2015 07:28:00 GMT" -> "2015-10-21T07:28:00Z". Returns the input unchanged if it does not parse.
std::string HttpDateToIso8601(const std::string& http_date);

// Seconds since the epoch -> "2015-10-21T07:28:00Z".
std::string EpochToIso8601(long long seconds);

#endif // S3_WIRE_HPP
