#ifndef S3_XML_HPP
#define S3_XML_HPP

#include <chrono>
#include <string>
#include <vector>
#include "bucket_registry.hpp"
#include "object_index.hpp"
#include "s3_error.hpp"

// Response documents of the S3 REST API and the few reads the probe client
// needs from them.

std::string XmlEscape(const std::string& text);
std::string XmlUnescape(const std::string& text);

// 2013-05-24T00:00:00.000Z
std::string FormatIso8601(std::chrono::system_clock::time_point when);

// Fri, 24 May 2013 00:00:00 GMT
std::string FormatHttpDate(std::chrono::system_clock::time_point when);

// ETag header/element value: the hex digest in double quotes.
std::string QuoteEtag(const std::string& etag);

// <Error><Code/><Message/><Resource/></Error>. An empty message uses the
// kind's default.
std::string ErrorXml(S3Error error, const std::string& resource, const std::string& message = "");

std::string CreateBucketResultXml(const std::string& bucket);

std::string ListBucketResultXml(const std::string& bucket, const std::vector<ObjectSummary>& objects);

std::string ListAllMyBucketsResultXml(const std::string& owner, const std::vector<BucketSummary>& buckets);

// Unescaped text of every <tag>...</tag> in document order. Not a general
// XML parser: no attributes on tag, no nesting of the same tag.
std::vector<std::string> ExtractElements(const std::string& xml, const std::string& tag);

#endif // S3_XML_HPP
