#include <gtest/gtest.h>
#include <string>
#include "network/router.hpp"

using namespace lfs::network;

namespace {
const std::string OID = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";
}

TEST(RouterTest, MetadataPath) {
  auto route = router::route("/objects/" + OID);
  ASSERT_TRUE(route.has_value());
  EXPECT_EQ(route->oid.str(), OID);
  EXPECT_EQ(route->intent, Intent::Metadata);
}

TEST(RouterTest, RawObjectPath) {
  auto route = router::route("/data/objects/" + OID);
  ASSERT_TRUE(route.has_value());
  EXPECT_EQ(route->oid.str(), OID);
  EXPECT_EQ(route->intent, Intent::RawObject);
}

TEST(RouterTest, RejectsInvalidIdentifier) {
  EXPECT_FALSE(router::route("/objects/short").has_value());
  EXPECT_FALSE(router::route("/data/objects/short").has_value());
  EXPECT_FALSE(router::route("/objects/").has_value());
  EXPECT_FALSE(router::route("/objects/" + std::string(64, 'Z')).has_value());
}

TEST(RouterTest, RejectsOtherPrefixes) {
  EXPECT_FALSE(router::route("/other/" + OID).has_value());
  EXPECT_FALSE(router::route("/" + OID).has_value());
  EXPECT_FALSE(router::route("objects/" + OID).has_value());
  EXPECT_FALSE(router::route("/objects/batch").has_value());
  EXPECT_FALSE(router::route("/data/objects/x/" + OID).has_value());
  EXPECT_FALSE(router::route("/objects/" + OID + "/").has_value());
  EXPECT_FALSE(router::route("//objects/" + OID).has_value());
  EXPECT_FALSE(router::route("").has_value());
  EXPECT_FALSE(router::route(OID).has_value());
}

TEST(RouterTest, ExtractHostFromHeader) {
  EXPECT_EQ(router::extract_host("/objects/x", "example.com"), "example.com");
  EXPECT_EQ(router::extract_host("/objects/x", "example.com:8080"), "example.com");
  EXPECT_EQ(router::extract_host("/objects/x", "[::1]:8080"), "[::1]");
  EXPECT_EQ(router::extract_host("/objects/x", "127.0.0.1"), "127.0.0.1");
}

TEST(RouterTest, ExtractHostFromAbsoluteTarget) {
  EXPECT_EQ(router::extract_host("http://lfs.local:9000/objects/x", ""), "lfs.local");
  EXPECT_EQ(router::extract_host("https://lfs.local/objects/x", "other"), "lfs.local");
  EXPECT_EQ(router::extract_host("http://user@lfs.local/objects/x", ""), "lfs.local");
  EXPECT_EQ(router::extract_host("http://lfs.local", ""), "lfs.local");
}

TEST(RouterTest, MissingHost) {
  EXPECT_FALSE(router::extract_host("/objects/x", "").has_value());
  EXPECT_FALSE(router::extract_host("/objects/x", ":8080").has_value());
  EXPECT_FALSE(router::extract_host("http:///objects/x", "example.com").has_value());
  EXPECT_FALSE(router::extract_host("*", "").has_value());
}

TEST(RouterTest, ExtractPath) {
  EXPECT_EQ(router::extract_path("/objects/" + OID), "/objects/" + OID);
  EXPECT_EQ(router::extract_path("/objects/" + OID + "?x=1"), "/objects/" + OID);
  EXPECT_EQ(router::extract_path("/objects/" + OID + "#frag"), "/objects/" + OID);
  EXPECT_EQ(router::extract_path("http://h:8080/data/objects/" + OID + "?a"), "/data/objects/" + OID);
  EXPECT_EQ(router::extract_path("http://h"), "");
  EXPECT_EQ(router::extract_path("http://h?query"), "");
}

TEST(RouterTest, HostWithInvalidCharactersIsRejected) {
  EXPECT_FALSE(router::extract_host("/objects/x", "h\xff\xfe").has_value());
  EXPECT_FALSE(router::extract_host("/objects/x", "h\xff:8080").has_value());
  EXPECT_FALSE(router::extract_host("/objects/x", "bad host").has_value());
  EXPECT_FALSE(router::extract_host("/objects/x", "a\"b").has_value());
  EXPECT_FALSE(router::extract_host("/objects/x", "[::1z]").has_value());
  EXPECT_FALSE(router::extract_host("/objects/x", "[]").has_value());
  EXPECT_FALSE(router::extract_host("http://h\xc3\xa9/objects/x", "example.com").has_value());

  EXPECT_EQ(router::extract_host("/objects/x", "my-host_1.example~"), "my-host_1.example~");
  EXPECT_EQ(router::extract_host("/objects/x", "xn--bcher-kva.example"), "xn--bcher-kva.example");
  EXPECT_EQ(router::extract_host("/objects/x", "[fe80::1.2.3.4]"), "[fe80::1.2.3.4]");
}
