#include "s3_wire.hpp"
#include <ctime>
#include <regex>
#include <sstream>

std::string ExtractXmlValue(const std::string& xml, const std::string& tag) {
    std::regex pattern("<" + tag + ">([^<]*)</" + tag + ">");
    std::smatch match;
    if (!std::regex_search(xml, match, pattern)) return "";
    return XmlUnescape(match[1].str());
}

std::string XmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string XmlUnescape(const std::string& text) {
    static const std::pair<const char*, char> kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}};

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& entity : kEntities) {
                size_t len = std::char_traits<char>::length(entity.first);
                if (text.compare(i, len, entity.first) == 0) {
                    out += entity.second;
                    i += len;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) out += text[i++];
    }
    return out;
}

std::string BuildCompleteMultipartXml(const std::vector<std::string>& etags) {
    std::ostringstream xml;
    xml << "<CompleteMultipartUpload>";
    for (size_t i = 0; i < etags.size(); ++i) {
        xml << "<Part><PartNumber>" << (i + 1) << "</PartNumber><ETag>" << XmlEscape(etags[i]) << "</ETag></Part>";
    }
    xml << "</CompleteMultipartUpload>";
    return xml.str();
}

std::string HttpDateToIso8601(const std::string& http_date) {
    std::tm parsed{};
    const char* end = strptime(http_date.c_str(), "%a, %d %b %Y %H:%M:%S", &parsed);
    if (end == nullptr) return http_date;
    return EpochToIso8601(static_cast<long long>(timegm(&parsed)));
}

std::string EpochToIso8601(long long seconds) {
    std::time_t when = static_cast<std::time_t>(seconds);
    std::tm gmt{};
    gmtime_r(&when, &gmt);
    char buffer[21];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return buffer;
}
