/**
 * Unit tests for HttpRequest headers and the auth decorators.
 */

#include <gtest/gtest.h>
#include <string>

#include "transport/auth.hpp"
#include "transport/http_transport.hpp"

TEST(HttpRequest, SetHeaderReplacesCaseInsensitively) {
  HttpRequest req;
  req.set_header("Content-Type", "text/plain");
  req.set_header("content-type", "application/json");

  ASSERT_EQ(req.headers.size(), 1u);
  ASSERT_NE(req.header("CONTENT-TYPE"), nullptr);
  EXPECT_EQ(*req.header("Content-Type"), "application/json");
  EXPECT_EQ(req.header("Authorization"), nullptr);
}

TEST(Auth, BearerTokenSetsAuthorization) {
  HttpRequest req;
  bearer_auth(std::string("secret"))(req);
  ASSERT_NE(req.header("Authorization"), nullptr);
  EXPECT_EQ(*req.header("Authorization"), "Bearer secret");
}

TEST(Auth, EmptyProvidedTokenLeavesRequestAlone) {
  HttpRequest req;
  bearer_auth([] { return std::string(); })(req);
  EXPECT_TRUE(req.headers.empty());
}

TEST(Auth, HeaderAuthOverwritesExisting) {
  HttpRequest req;
  req.set_header("X-Api-Key", "old");
  header_auth("x-api-key", "new")(req);
  ASSERT_EQ(req.headers.size(), 1u);
  EXPECT_EQ(*req.header("X-Api-Key"), "new");
}

TEST(Auth, ChainAppliesInOrder) {
  HttpRequest req;
  auto auth = chain_auth({
      header_auth("X-Tenant", "t1"),
      bearer_auth(std::string("first")),
      nullptr,
      bearer_auth(std::string("second")),
  });
  auth(req);
  EXPECT_EQ(*req.header("X-Tenant"), "t1");
  EXPECT_EQ(*req.header("Authorization"), "Bearer second");
}
