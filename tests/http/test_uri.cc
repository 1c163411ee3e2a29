#include <gtest/gtest.h>

#include "conduit/http/client_errors.h"
#include "conduit/http/uri.h"

namespace conduit {
namespace http {
namespace {

Uri parseOk(const std::string& text) {
  auto result = Uri::parse(text);
  EXPECT_TRUE(is_success(result)) << text;
  return is_success(result) ? get<Uri>(result) : Uri();
}

TEST(UriTest, ParsesComponents) {
  Uri uri = parseOk("HTTP://Example.COM:8080/a/b?x=1#frag");
  EXPECT_EQ("http", uri.scheme());
  EXPECT_EQ("example.com", uri.host());
  EXPECT_EQ(8080, uri.port());
  EXPECT_TRUE(uri.hasExplicitPort());
  EXPECT_EQ("/a/b", uri.path());
  EXPECT_EQ("x=1", uri.query());
  EXPECT_EQ("/a/b?x=1", uri.pathAndQuery());
  EXPECT_EQ("example.com:8080", uri.authority());
  EXPECT_EQ("http://example.com:8080/a/b?x=1", uri.toString());
}

TEST(UriTest, DefaultsPathAndPort) {
  Uri uri = parseOk("https://example.com");
  EXPECT_EQ(443, uri.port());
  EXPECT_FALSE(uri.hasExplicitPort());
  EXPECT_EQ("/", uri.path());
  EXPECT_FALSE(uri.hasQuery());
  EXPECT_TRUE(uri.secure());
  EXPECT_EQ("example.com", uri.authority());
}

TEST(UriTest, Ipv6LiteralAndUserInfo) {
  Uri uri = parseOk("http://user:pw@[::1]:9000/");
  EXPECT_EQ("::1", uri.host());
  EXPECT_EQ(9000, uri.port());
  EXPECT_EQ("[::1]:9000", uri.authority());
}

TEST(UriTest, RejectsInvalidTargets) {
  for (const char* text :
       {"/relative", "ftp://example.com/", "http://", "http://:80/",
        "http://host:0/", "http://host:70000/", "http://host:8a/",
        "http://[::1/"}) {
    auto result = Uri::parse(text);
    ASSERT_TRUE(is_error(result)) << text;
    EXPECT_TRUE(hasCode(*get_error(result), ClientErrorCode::InvalidUri));
  }
}

TEST(UriTest, ResolvesReferences) {
  Uri base = parseOk("http://example.com/a/b/c?q=1");

  EXPECT_EQ("http://example.com/a/b/d",
            get<Uri>(base.resolve("d")).toString());
  EXPECT_EQ("http://example.com/a/x",
            get<Uri>(base.resolve("../x")).toString());
  EXPECT_EQ("http://example.com/root?y=2",
            get<Uri>(base.resolve("/root?y=2")).toString());
  EXPECT_EQ("http://example.com/a/b/c?z",
            get<Uri>(base.resolve("?z")).toString());
  EXPECT_EQ("http://other.org/p",
            get<Uri>(base.resolve("//other.org/p")).toString());
  EXPECT_EQ("https://secure.example/",
            get<Uri>(base.resolve("https://secure.example/")).toString());
  EXPECT_EQ("http://example.com/a/c",
            get<Uri>(base.resolve("/a/b/../c")).toString());
  EXPECT_EQ(base.toString(), get<Uri>(base.resolve("")).toString());
}

TEST(UriTest, ResolveRejectsUnsupportedScheme) {
  Uri base = parseOk("http://example.com/");
  auto result = base.resolve("mailto:someone@example.com");
  EXPECT_TRUE(is_error(result));
}

TEST(UriTest, WithSchemeFollowsDefaultPort) {
  Uri plain = parseOk("https://example.com/chat");
  Uri ws = plain.withScheme("wss");
  EXPECT_EQ("wss://example.com/chat", ws.toString());
  EXPECT_TRUE(ws.isWebSocket());
  EXPECT_TRUE(ws.secure());

  Uri insecure = parseOk("http://example.com/").withScheme("wss");
  EXPECT_EQ(443, insecure.port());

  Uri pinned = parseOk("http://example.com:8080/").withScheme("ws");
  EXPECT_EQ(8080, pinned.port());
}

}  // namespace
}  // namespace http
}  // namespace conduit
