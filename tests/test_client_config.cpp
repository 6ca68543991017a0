#include <gtest/gtest.h>

#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

#include "conf/apns_client_config.hpp"
#include "include/test_key_util.hpp"

namespace apnsclient {

TEST(ClientConfigTest, TokenAuthConfigLoads) {
  testutil::TempDir dir;
  auto path = dir.write("apns.json", R"({
    "endpoint": "sandbox",
    "topic": "com.example.app",
    "team_id": "TEAM456789",
    "key_id": "ABC123DEFG",
    "signing_key_path": "/etc/apns/AuthKey_ABC123DEFG.p8",
    "request_timeout_ms": 5000,
    "logging": {"level": "debug"}
  })");
  auto cfg = load_client_config(path);
  ASSERT_TRUE(cfg.is_ok()) << cfg.error();
  const auto &c = cfg.value();
  EXPECT_EQ(c.endpoint, Endpoint::Sandbox);
  EXPECT_EQ(c.effective_host(), "api.sandbox.push.apple.com");
  EXPECT_EQ(c.port, "443");
  EXPECT_EQ(c.topic, "com.example.app");
  EXPECT_TRUE(c.uses_token_auth());
  EXPECT_EQ(c.request_timeout(), std::chrono::milliseconds(5000));
  EXPECT_EQ(c.token_ttl_seconds, 55 * 60);
  EXPECT_EQ(c.logging.level, "debug");
  EXPECT_TRUE(c.verify_tls);
}

TEST(ClientConfigTest, HostOverrideAndNumericPort) {
  testutil::TempDir dir;
  auto path = dir.write("apns.json", R"({
    "host": "gateway.internal",
    "port": 8443,
    "client_cert_path": "/etc/apns/push.pem",
    "verify_tls": false
  })");
  auto cfg = load_client_config(path);
  ASSERT_TRUE(cfg.is_ok()) << cfg.error();
  EXPECT_EQ(cfg.value().effective_host(), "gateway.internal");
  EXPECT_EQ(cfg.value().port, "8443");
  EXPECT_FALSE(cfg.value().uses_token_auth());
  EXPECT_FALSE(cfg.value().verify_tls);
}

TEST(ClientConfigTest, MissingFileIsReadFailure) {
  testutil::TempDir dir;
  auto cfg = load_client_config(dir.path() / "absent.json");
  ASSERT_TRUE(cfg.is_err());
  EXPECT_EQ(cfg.error().kind(), ErrorKind::Read);
}

TEST(ClientConfigTest, OpenFailureKeepsOsReason) {
  testutil::TempDir dir;
  auto path = dir.write("apns.json", R"({"client_cert_path": "/c.pem"})");

  // The next descriptor number becomes the limit, so the open below fails
  // with EMFILE after the stat succeeds.
  int next_fd = ::open("/dev/null", O_RDONLY);
  ASSERT_GE(next_fd, 0);
  ::close(next_fd);
  rlimit saved{};
  ASSERT_EQ(::getrlimit(RLIMIT_NOFILE, &saved), 0);
  rlimit tight = saved;
  tight.rlim_cur = static_cast<rlim_t>(next_fd);
  ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &tight), 0);

  auto cfg = load_client_config(path);
  ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &saved), 0);

  ASSERT_TRUE(cfg.is_err());
  EXPECT_EQ(cfg.error().kind(), ErrorKind::Read);
  ASSERT_TRUE(cfg.error().detail().has_value());
  EXPECT_NE(cfg.error().detail()->find("Too many open files"),
            std::string_view::npos)
      << *cfg.error().detail();
  EXPECT_EQ(cfg.error().detail()->find("Permission denied"),
            std::string_view::npos);
}

TEST(ClientConfigTest, StringFieldsKeepEmbeddedNul) {
  boost::json::value jv = boost::json::object{
      {"topic", boost::json::string("com.example\0app", 15)},
      {"client_cert_path", "/c.pem"}};
  auto cfg = boost::json::value_to<ApnsClientConfig>(jv);
  ASSERT_TRUE(cfg.topic.has_value());
  EXPECT_EQ(cfg.topic->size(), 15u);
  // The NUL is a control character, so the topic cannot be used as a header.
  EXPECT_EQ(cfg.validate().error().kind(), ErrorKind::InvalidOptions);
}

TEST(ClientConfigTest, MalformedJsonIsSerializeFailure) {
  testutil::TempDir dir;
  auto path = dir.write("apns.json", R"({"endpoint": "sandbox",)");
  auto cfg = load_client_config(path);
  ASSERT_TRUE(cfg.is_err());
  EXPECT_EQ(cfg.error(), Error(SerializeFailure{}));
}

TEST(ClientConfigTest, WrongShapeIsSerializeFailure) {
  testutil::TempDir dir;
  auto path = dir.write("apns.json", R"({"endpoint": "staging"})");
  auto cfg = load_client_config(path);
  ASSERT_TRUE(cfg.is_err());
  EXPECT_EQ(cfg.error().kind(), ErrorKind::Serialize);
}

TEST(ClientConfigTest, NoAuthenticationIsInvalidOptions) {
  testutil::TempDir dir;
  auto path = dir.write("apns.json", R"({"topic": "com.example.app"})");
  auto cfg = load_client_config(path);
  ASSERT_TRUE(cfg.is_err());
  EXPECT_EQ(cfg.error().kind(), ErrorKind::InvalidOptions);
}

TEST(ClientConfigTest, ValidateRejectsPartialOrMixedAuth) {
  ApnsClientConfig partial;
  partial.signing_key_path = "/k.p8";
  partial.key_id = "KID";
  EXPECT_TRUE(partial.validate().is_err());

  ApnsClientConfig mixed;
  mixed.signing_key_path = "/k.p8";
  mixed.key_id = "KID";
  mixed.team_id = "TEAM";
  mixed.client_cert_path = "/c.pem";
  EXPECT_TRUE(mixed.validate().is_err());

  ApnsClientConfig zero_timeout;
  zero_timeout.client_cert_path = "/c.pem";
  zero_timeout.request_timeout_ms = 0;
  auto result = zero_timeout.validate();
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind(), ErrorKind::InvalidOptions);
}

} // namespace apnsclient
