#include <gtest/gtest.h>

#include "config/options.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace {

std::expected<Options, std::string> Parse(std::initializer_list<const char *> args) {
  std::vector<std::string> storage{"codeworker"};
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char *> argv;
  for (auto &s : storage) {
    argv.push_back(s.data());
  }
  return ParseArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(Options, Defaults) {
  auto opt = Parse({});
  ASSERT_TRUE(opt.has_value()) << opt.error();
  EXPECT_EQ(opt->mode, RunMode::stdio);
  EXPECT_EQ(opt->default_timeout, std::chrono::milliseconds(30000));
  EXPECT_EQ(opt->install_timeout, std::chrono::milliseconds(120000));
  EXPECT_TRUE(opt->eager_init);
  EXPECT_FALSE(opt->quiet);
  EXPECT_FALSE(opt->workdir.empty());
  EXPECT_TRUE(opt->journal.empty());
}

TEST(Options, WebSocketMode) {
  auto opt = Parse({"--mode", "ws", "-l", "ws://0.0.0.0:9000", "-t", "1500",
                    "--install-timeout-ms", "60000", "-w", "/tmp/cw",
                    "-j", "/tmp/cw.journal", "--no-eager-init", "-q"});
  ASSERT_TRUE(opt.has_value()) << opt.error();
  EXPECT_EQ(opt->mode, RunMode::ws);
  EXPECT_EQ(opt->listen, "ws://0.0.0.0:9000");
  EXPECT_EQ(opt->default_timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(opt->install_timeout, std::chrono::milliseconds(60000));
  EXPECT_EQ(opt->workdir, std::filesystem::path("/tmp/cw"));
  EXPECT_EQ(opt->journal, "/tmp/cw.journal");
  EXPECT_FALSE(opt->eager_init);
  EXPECT_TRUE(opt->quiet);
}

TEST(Options, SecureListenNeedsCertificateAndKey) {
  EXPECT_FALSE(Parse({"-m", "ws", "-l", "wss://127.0.0.1:8443"}).has_value());
  EXPECT_FALSE(Parse({"-m", "ws", "-l", "wss://127.0.0.1:8443", "--tls-cert",
                      "c.pem"})
                   .has_value());
  auto opt = Parse({"-m", "ws", "-l", "wss://127.0.0.1:8443", "--tls-cert",
                    "c.pem", "--tls-key", "k.pem"});
  ASSERT_TRUE(opt.has_value()) << opt.error();
  EXPECT_EQ(opt->tls_key, "k.pem");
}

TEST(Options, CertificateWithoutSecureListenIsAnError) {
  EXPECT_FALSE(
      Parse({"-m", "ws", "--tls-cert", "c.pem", "--tls-key", "k.pem"})
          .has_value());
}

TEST(Options, RejectsBadValues) {
  EXPECT_FALSE(Parse({"--mode", "grpc"}).has_value());
  EXPECT_FALSE(Parse({"-t", "0"}).has_value());
  EXPECT_FALSE(Parse({"-t", "-5"}).has_value());
  EXPECT_FALSE(Parse({"-t", "12ms"}).has_value());
  EXPECT_FALSE(Parse({"-t"}).has_value());
  EXPECT_FALSE(Parse({"--frobnicate"}).has_value());
  EXPECT_FALSE(Parse({"-m", "ws", "-l", "http://localhost:80"}).has_value());
}

TEST(Options, ErrorNamesTheFlag) {
  auto opt = Parse({"--default-timeout-ms", "soon"});
  ASSERT_FALSE(opt.has_value());
  EXPECT_NE(opt.error().find("--default-timeout-ms"), std::string::npos);
}

TEST(Options, Help) {
  auto opt = Parse({"-h"});
  ASSERT_TRUE(opt.has_value());
  EXPECT_TRUE(opt->show_help);
  EXPECT_NE(std::string(Usage()).find("--mode"), std::string::npos);
}
