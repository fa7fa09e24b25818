#include <gtest/gtest.h>

#include "protocol/codec.hpp"

using namespace protocol;

TEST(ProtocolCodec, ParsesSingleFileRun) {
  auto req = ParseRequest(R"({"type":"run","id":3,"code":"x = 1","timeout":250})");
  ASSERT_TRUE(req.has_value()) << req.error().message;
  auto *run = std::get_if<RunRequest>(&req->command);
  ASSERT_NE(run, nullptr);
  EXPECT_EQ(run->code, "x = 1");
  EXPECT_FALSE(run->IsProject());
  EXPECT_EQ(run->timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(std::get<std::int64_t>(*req->id), 3);
}

TEST(ProtocolCodec, RunWithoutTimeoutLeavesItToTheController) {
  auto req = ParseRequest(R"({"type":"run","code":"pass"})");
  ASSERT_TRUE(req.has_value());
  EXPECT_FALSE(std::get<RunRequest>(req->command).timeout.has_value());
  EXPECT_FALSE(req->id.has_value());
}

TEST(ProtocolCodec, ParsesProjectRun) {
  auto req = ParseRequest(R"({"type":"run","entryPoint":"main.py",
      "files":[{"path":"main.py","content":"import util"},
               {"path":"util.py","content":""}]})");
  ASSERT_TRUE(req.has_value()) << req.error().message;
  const auto &run = std::get<RunRequest>(req->command);
  EXPECT_TRUE(run.IsProject());
  EXPECT_EQ(run.entry_point, "main.py");
  ASSERT_EQ(run.files.size(), 2u);
  EXPECT_EQ(run.files[1].path, "util.py");
}

TEST(ProtocolCodec, ProjectRunNeedsEntryPoint) {
  auto req = ParseRequest(
      R"({"type":"run","files":[{"path":"a.py","content":""}]})");
  ASSERT_FALSE(req.has_value());
  EXPECT_EQ(req.error().message,
            "Malformed message: entryPoint is required with files");
}

TEST(ProtocolCodec, RunNeedsCode) {
  auto req = ParseRequest(R"({"type":"run","id":"a"})");
  ASSERT_FALSE(req.has_value());
  EXPECT_EQ(req.error().message, "Malformed message: code is required for run");
  ASSERT_TRUE(req.error().id.has_value());
  EXPECT_EQ(std::get<std::string>(*req.error().id), "a");
}

TEST(ProtocolCodec, RejectsNonPositiveOrFractionalTimeout) {
  for (const char *text : {R"({"type":"run","code":"","timeout":0})",
                           R"({"type":"run","code":"","timeout":-5})",
                           R"({"type":"run","code":"","timeout":1.5})",
                           R"({"type":"run","code":"","timeout":"10"})"}) {
    auto req = ParseRequest(text);
    EXPECT_FALSE(req.has_value()) << text;
  }
}

TEST(ProtocolCodec, OversizedTimeoutSaturates) {
  auto req = ParseRequest(
      R"({"type":"run","code":"","timeout":18446744073709551615})");
  ASSERT_TRUE(req.has_value()) << req.error().message;
  EXPECT_EQ(std::get<RunRequest>(req->command).timeout,
            std::chrono::milliseconds::max());
}

TEST(ProtocolCodec, ParsesInstall) {
  auto req = ParseRequest(R"({"type":"install","packages":["numpy","rich"]})");
  ASSERT_TRUE(req.has_value());
  const auto &install = std::get<InstallRequest>(req->command);
  EXPECT_EQ(install.packages, (std::vector<std::string>{"numpy", "rich"}));
}

TEST(ProtocolCodec, InstallNeedsPackages) {
  EXPECT_FALSE(ParseRequest(R"({"type":"install"})").has_value());
  EXPECT_FALSE(ParseRequest(R"({"type":"install","packages":[]})").has_value());
  EXPECT_FALSE(ParseRequest(R"({"type":"install","packages":[""]})").has_value());
  EXPECT_FALSE(ParseRequest(R"({"type":"install","packages":[1]})").has_value());
}

TEST(ProtocolCodec, ParsesLifecycleRequests) {
  EXPECT_TRUE(std::holds_alternative<InitRequest>(
      ParseRequest(R"({"type":"init"})")->command));
  EXPECT_TRUE(std::holds_alternative<InterruptRequest>(
      ParseRequest(R"({"type":"interrupt"})")->command));
  EXPECT_TRUE(std::holds_alternative<RestartRequest>(
      ParseRequest(R"({"type":"restart"})")->command));
}

TEST(ProtocolCodec, ReportsMalformedInput) {
  EXPECT_EQ(ParseRequest("not json").error().message,
            "Malformed message: invalid JSON");
  EXPECT_EQ(ParseRequest("[1,2]").error().message,
            "Malformed message: expected a JSON object");
  EXPECT_EQ(ParseRequest(R"({"code":"x"})").error().message,
            "Malformed message: type is required");
  EXPECT_EQ(ParseRequest(R"({"type":"shell"})").error().message,
            "Unknown message type: shell");
  EXPECT_EQ(ParseRequest(R"({"type":"init","id":[1]})").error().message,
            "Malformed message: id must be a string or an integer");
}

TEST(ProtocolCodec, SerializesOnlyPresentFields) {
  Response r;
  r.type = ResponseType::ready;
  auto j = nlohmann::json::parse(Serialize(r));
  EXPECT_EQ(j, nlohmann::json({{"type", "ready"}}));
}

TEST(ProtocolCodec, SerializesResultFields) {
  Response r;
  r.type = ResponseType::error;
  r.id = RequestId{std::string("job-1")};
  r.output = "before\n";
  r.out = "before\n";
  r.err = "";
  r.error = "Traceback\nValueError: boom";
  r.execution_time_ms = 12.5;
  const std::string line = Serialize(r);
  EXPECT_EQ(line.find('\n'), std::string::npos);
  auto j = nlohmann::json::parse(line);
  EXPECT_EQ(j["type"], "error");
  EXPECT_EQ(j["id"], "job-1");
  EXPECT_EQ(j["output"], "before\n");
  EXPECT_EQ(j["stdout"], "before\n");
  EXPECT_EQ(j["stderr"], "");
  EXPECT_EQ(j["error"], "Traceback\nValueError: boom");
  EXPECT_DOUBLE_EQ(j["executionTime"].get<double>(), 12.5);
}

TEST(ProtocolCodec, InvalidUtf8FromTheGuestIsReplaced) {
  Response r;
  r.type = ResponseType::success;
  r.output = std::string("ok \xff\xfe");
  std::string line;
  ASSERT_NO_THROW(line = Serialize(r));
  EXPECT_NE(line.find("ok "), std::string::npos);
}
