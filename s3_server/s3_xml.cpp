#include "s3_xml.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

const char* kXmlHeader = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
const char* kS3Namespace = "http://s3.amazonaws.com/doc/2006-03-01/";

std::string Element(const std::string& tag, const std::string& content) {
    return "<" + tag + ">" + XmlEscape(content) + "</" + tag + ">";
}

std::tm ToUtc(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    return tm_utc;
}

} // namespace

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
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string XmlUnescape(const std::string& text) {
    static const std::pair<const char*, char> kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool matched = false;
        if (text[i] == '&') {
            for (const auto& entity : kEntities) {
                std::string name(entity.first);
                if (text.compare(i, name.size(), name) == 0) {
                    out.push_back(entity.second);
                    i += name.size();
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

std::string FormatIso8601(std::chrono::system_clock::time_point when) {
    std::tm tm_utc = ToUtc(when);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

std::string FormatHttpDate(std::chrono::system_clock::time_point when) {
    static const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::tm tm_utc = ToUtc(when);

    std::stringstream ss;
    ss << kDays[tm_utc.tm_wday] << ", " << std::setfill('0') << std::setw(2) << tm_utc.tm_mday << ' '
       << kMonths[tm_utc.tm_mon] << ' ' << (tm_utc.tm_year + 1900) << ' '
       << std::setw(2) << tm_utc.tm_hour << ':' << std::setw(2) << tm_utc.tm_min << ':'
       << std::setw(2) << tm_utc.tm_sec << " GMT";
    return ss.str();
}

std::string QuoteEtag(const std::string& etag) {
    return "\"" + etag + "\"";
}

std::string ErrorXml(S3Error error, const std::string& resource, const std::string& message) {
    std::string out = kXmlHeader;
    out += "<Error>";
    out += Element("Code", ErrorCode(error));
    out += Element("Message", message.empty() ? ErrorMessage(error) : message);
    out += Element("Resource", resource);
    out += "</Error>";
    return out;
}

std::string CreateBucketResultXml(const std::string& bucket) {
    std::string out = kXmlHeader;
    out += "<CreateBucketResult xmlns=\"" + std::string(kS3Namespace) + "\">";
    out += Element("Location", "/" + bucket);
    out += "</CreateBucketResult>";
    return out;
}

std::string ListBucketResultXml(const std::string& bucket, const std::vector<ObjectSummary>& objects) {
    std::string out = kXmlHeader;
    out += "<ListBucketResult xmlns=\"" + std::string(kS3Namespace) + "\">";
    out += Element("Name", bucket);
    out += "<Prefix></Prefix><Marker></Marker>";
    out += Element("MaxKeys", "1000");
    out += "<IsTruncated>false</IsTruncated>";
    for (const auto& object : objects) {
        out += "<Contents>";
        out += Element("Key", object.key);
        out += Element("LastModified", FormatIso8601(object.meta.last_modified));
        out += Element("ETag", QuoteEtag(object.meta.etag));
        out += Element("Size", std::to_string(object.meta.size));
        out += Element("StorageClass", "STANDARD");
        out += "</Contents>";
    }
    out += "</ListBucketResult>";
    return out;
}

std::string ListAllMyBucketsResultXml(const std::string& owner, const std::vector<BucketSummary>& buckets) {
    std::string out = kXmlHeader;
    out += "<ListAllMyBucketsResult xmlns=\"" + std::string(kS3Namespace) + "\">";
    out += "<Owner>" + Element("ID", owner) + Element("DisplayName", owner) + "</Owner>";
    out += "<Buckets>";
    for (const auto& bucket : buckets) {
        out += "<Bucket>";
        out += Element("Name", bucket.name);
        out += Element("CreationDate", FormatIso8601(bucket.created));
        out += "</Bucket>";
    }
    out += "</Buckets>";
    out += "</ListAllMyBucketsResult>";
    return out;
}

std::vector<std::string> ExtractElements(const std::string& xml, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";

    std::vector<std::string> values;
    size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t start = pos + open.size();
        size_t end = xml.find(close, start);
        if (end == std::string::npos) {
            break;
        }
        values.push_back(XmlUnescape(xml.substr(start, end - start)));
        pos = end + close.size();
    }
    return values;
}
