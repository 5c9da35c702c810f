// Repository: loopcast
// Component: WebDAV multistatus parser and endpoint helpers unit tests

#include <gtest/gtest.h>

#include "loopcast/Errors.hpp"
#include "loopcast/source/MultistatusParser.hpp"
#include "loopcast/source/WebDavTransport.hpp"

namespace loopcast::source {
namespace {

TEST(MultistatusParserTest, ParsesCollectionsFilesAndLengths) {
  const std::string xml = R"(<?xml version="1.0" encoding="utf-8"?>
<d:multistatus xmlns:d="DAV:">
  <d:response>
    <d:href>/dav/videos/</d:href>
    <d:propstat>
      <d:prop><d:resourcetype><d:collection/></d:resourcetype></d:prop>
      <d:status>HTTP/1.1 200 OK</d:status>
    </d:propstat>
  </d:response>
  <d:response>
    <d:href>/dav/videos/My%20Show%20S01.mp4</d:href>
    <d:propstat>
      <d:prop>
        <d:resourcetype/>
        <d:getcontentlength>1048576</d:getcontentlength>
        <d:displayname>My Show S01.mp4</d:displayname>
      </d:prop>
      <d:status>HTTP/1.1 200 OK</d:status>
    </d:propstat>
  </d:response>
</d:multistatus>)";

  const auto entries = ParseMultistatus(xml);
  ASSERT_EQ(entries.size(), 2u);

  EXPECT_EQ(entries[0].server_path, "/dav/videos");
  EXPECT_TRUE(entries[0].is_collection);

  EXPECT_EQ(entries[1].server_path, "/dav/videos/My Show S01.mp4");
  EXPECT_FALSE(entries[1].is_collection);
  ASSERT_TRUE(entries[1].content_length.has_value());
  EXPECT_EQ(*entries[1].content_length, 1048576);
  EXPECT_EQ(entries[1].display_name, "My Show S01.mp4");
}

TEST(MultistatusParserTest, DropsResponsesWithoutSuccessfulPropstat) {
  const std::string xml = R"(<D:multistatus xmlns:D="DAV:">
  <D:response>
    <D:href>/locked.mp4</D:href>
    <D:propstat>
      <D:prop><D:getcontentlength/></D:prop>
      <D:status>HTTP/1.1 403 Forbidden</D:status>
    </D:propstat>
  </D:response>
  <D:response>
    <D:href>/ok.mp4</D:href>
    <D:propstat>
      <D:prop><D:getcontentlength>5</D:getcontentlength></D:prop>
      <D:status>HTTP/1.1 200 OK</D:status>
    </D:propstat>
    <D:propstat>
      <D:prop><D:quota-used-bytes/></D:prop>
      <D:status>HTTP/1.1 404 Not Found</D:status>
    </D:propstat>
  </D:response>
</D:multistatus>)";

  const auto entries = ParseMultistatus(xml);
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].server_path, "/ok.mp4");
  EXPECT_EQ(entries[0].content_length.value_or(-1), 5);
}

TEST(MultistatusParserTest, AcceptsAbsoluteHrefs) {
  const std::string xml = R"(<multistatus xmlns="DAV:"><response>
    <href>https://cloud.example.com/remote.php/dav/files/u/clip.mkv</href>
    <propstat><prop><resourcetype/></prop><status>HTTP/1.1 200 OK</status></propstat>
  </response></multistatus>)";

  const auto entries = ParseMultistatus(xml);
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].server_path, "/remote.php/dav/files/u/clip.mkv");
}

TEST(MultistatusParserTest, MalformedBodiesAreSourceUnavailable) {
  EXPECT_THROW(ParseMultistatus("<html><body>Login</body></html>"), SourceUnavailableError);
  EXPECT_THROW(ParseMultistatus("not xml at all <"), SourceUnavailableError);
}

TEST(MultistatusParserTest, NormalizeHref) {
  EXPECT_EQ(NormalizeHref("/a/b%20c/"), "/a/b c");
  EXPECT_EQ(NormalizeHref("http://host:8080/x/y.mp4"), "/x/y.mp4");
  EXPECT_EQ(NormalizeHref("http://host"), "/");
  EXPECT_EQ(NormalizeHref("/"), "/");
}

TEST(DavEndpointTest, ParsesSchemeHostPortAndBasePath) {
  const DavEndpoint plain = DavEndpoint::Parse("http://nas.local/dav/");
  EXPECT_FALSE(plain.tls);
  EXPECT_EQ(plain.host, "nas.local");
  EXPECT_EQ(plain.port, "80");
  EXPECT_EQ(plain.base_path, "/dav");
  EXPECT_EQ(plain.Origin(), "http://nas.local");

  const DavEndpoint tls = DavEndpoint::Parse("https://cloud.example.com:8443");
  EXPECT_TRUE(tls.tls);
  EXPECT_EQ(tls.port, "8443");
  EXPECT_EQ(tls.base_path, "");
  EXPECT_EQ(tls.Origin(), "https://cloud.example.com:8443");

  EXPECT_THROW(DavEndpoint::Parse("ftp://nas.local"), ConfigError);
  EXPECT_THROW(DavEndpoint::Parse("https:///dav"), ConfigError);
}

TEST(DavEndpointTest, PathEncodingRoundTripsReservedCharacters) {
  EXPECT_EQ(PercentEncodePath("/Movies/A & B (2020).mp4"), "/Movies/A%20%26%20B%20%282020%29.mp4");
  EXPECT_EQ(PercentDecode("/Movies/A%20%26%20B%20%282020%29.mp4"), "/Movies/A & B (2020).mp4");
}

TEST(DavEndpointTest, BasicAuthorizationHeader) {
  EXPECT_EQ(BasicAuthorization("user", "pass"), "Basic dXNlcjpwYXNz");
  EXPECT_EQ(BasicAuthorization("", ""), "Basic Og==");
}

}  // namespace
}  // namespace loopcast::source
