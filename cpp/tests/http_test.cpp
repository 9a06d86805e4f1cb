#include <gtest/gtest.h>
#include "fetch_pool.hpp"
#include "http.hpp"

using namespace siphon;

TEST(HttpTest, UrlPath) {
  EXPECT_EQ(url_path("https://api.test/v1/items"), "/v1/items");
  EXPECT_EQ(url_path("https://api.test/v1/items?page=2#top"), "/v1/items");
  EXPECT_EQ(url_path("http://api.test"), "");
  EXPECT_EQ(url_path("https://api.test/"), "/");
  EXPECT_EQ(url_path("/relative/path"), "/relative/path");
}

TEST(HttpTest, HeaderLookupIgnoresCase) {
  Response rsp;
  rsp.headers = {{"content-type", "application/json"}, {"X-Count", "3"}};
  EXPECT_EQ(rsp.header("Content-Type"), "application/json");
  EXPECT_EQ(rsp.header("x-count"), "3");
  EXPECT_EQ(rsp.header("Accept"), "");
}

TEST(ResolveTableTest, ExplicitNameWins) {
  RequestSpec spec;
  spec.request.url = "https://api.test/v1/items";
  spec.table = "products";
  EXPECT_EQ(resolve_table(spec), "products");
}

TEST(ResolveTableTest, DerivedFromPathWithoutSeparators) {
  RequestSpec spec;
  spec.request.url = "https://api.test/v1/items?limit=10";
  EXPECT_EQ(resolve_table(spec), "v1items");
  // The request is not rewritten.
  EXPECT_TRUE(spec.table.empty());
}
