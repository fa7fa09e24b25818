#include <gtest/gtest.h>

#include "capture/output_capture.hpp"
#include "core/session.hpp"
#include "engine/python_interpreter.hpp"
#include "exec/supervisor.hpp"
#include "support/host_loop.hpp"
#include <atomic>
#include <filesystem>
#include <optional>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

std::filesystem::path ScratchDir(const std::string &name) {
  static std::atomic<int> counter{0};
  return std::filesystem::temp_directory_path() /
         ("codeworker-py-" + std::to_string(::getpid()) + "-" + name + "-" +
          std::to_string(counter++));
}

engine::PythonSettings MakeSettings(const std::string &name) {
  const auto root = ScratchDir(name);
  return engine::PythonSettings{.project_root = root / "project",
                                .packages_dir = root / "site-packages"};
}

struct Captured {
  engine::OpResult status;
  capture::CapturedOutput output;
};

// clear -> capture -> job -> release -> read, on the calling thread
template <typename Job>
Captured RunCaptured(engine::PythonInterpreter &py, Job job) {
  auto &buffer = py.Output();
  buffer.Clear();
  Captured c;
  {
    capture::CaptureScope scope(buffer);
    c.status = job();
  }
  c.output = buffer.Read();
  return c;
}

class PythonInterpreterTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(py.Load().has_value());
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(py.Settings().project_root.parent_path(), ec);
  }

  Captured Exec(const std::string &code) {
    return RunCaptured(py, [&] { return py.Execute(code); });
  }

  engine::PythonInterpreter py{MakeSettings("unit")};
};

} // namespace

TEST_F(PythonInterpreterTest, PrintIsCaptured) {
  Captured c = Exec("print('hi')");
  ASSERT_TRUE(c.status.has_value()) << c.status.error();
  EXPECT_EQ(c.output.out, "hi\n");
  EXPECT_EQ(c.output.err, "");
}

TEST_F(PythonInterpreterTest, StderrIsCapturedSeparately) {
  Captured c = Exec("import sys\nprint('out')\nprint('err', file=sys.stderr)");
  ASSERT_TRUE(c.status.has_value());
  EXPECT_EQ(c.output.out, "out\n");
  EXPECT_EQ(c.output.err, "err\n");
}

TEST_F(PythonInterpreterTest, ExceptionKeepsPartialOutput) {
  Captured c = Exec("print('before')\nraise ValueError('boom')");
  ASSERT_FALSE(c.status.has_value());
  EXPECT_NE(c.status.error().find("ValueError: boom"), std::string::npos);
  EXPECT_EQ(c.output.out, "before\n");
}

TEST_F(PythonInterpreterTest, SyntaxErrorIsReported) {
  Captured c = Exec("def broken(:\n  pass");
  ASSERT_FALSE(c.status.has_value());
  EXPECT_NE(c.status.error().find("SyntaxError"), std::string::npos);
}

TEST_F(PythonInterpreterTest, SystemExitIsAGuestError) {
  Captured c = Exec("raise SystemExit(3)");
  EXPECT_FALSE(c.status.has_value());
  // the interpreter survives
  EXPECT_TRUE(Exec("print(1)").status.has_value());
}

TEST_F(PythonInterpreterTest, LoneSurrogateDoesNotLoseOutput) {
  Captured c = Exec("import sys\nprint('visible line')\nprint('\\udc80')\n"
                    "print('\\ud800', file=sys.stderr)");
  ASSERT_TRUE(c.status.has_value()) << c.status.error();
  EXPECT_EQ(c.output.out, "visible line\n\\udc80\n");
  EXPECT_EQ(c.output.err, "\\ud800\n");
}

TEST_F(PythonInterpreterTest, NonAsciiOutputIsUtf8) {
  Captured c = Exec("print('h\\u00e9llo \\u2713')");
  ASSERT_TRUE(c.status.has_value());
  EXPECT_EQ(c.output.out, "h\xc3\xa9llo \xe2\x9c\x93\n");
}

TEST_F(PythonInterpreterTest, NamespacePersistsAcrossRuns) {
  ASSERT_TRUE(Exec("counter = 41").status.has_value());
  Captured c = Exec("counter += 1\nprint(counter)");
  ASSERT_TRUE(c.status.has_value());
  EXPECT_EQ(c.output.out, "42\n");
}

TEST_F(PythonInterpreterTest, OutputDoesNotLeakBetweenRuns) {
  ASSERT_TRUE(Exec("print('first')").status.has_value());
  Captured c = Exec("print('second')");
  EXPECT_EQ(c.output.out, "second\n");
}

TEST_F(PythonInterpreterTest, HelperNamesAreNotVisibleToGuests) {
  Captured c = Exec("print('_capture' in globals(), __name__)");
  ASSERT_TRUE(c.status.has_value());
  EXPECT_EQ(c.output.out, "False __main__\n");
}

TEST_F(PythonInterpreterTest, ProjectEntryPointImportsItsModules) {
  std::vector<engine::SourceFile> files{
      {"main.py", "from helper import greet\n"
                  "import shapes\n"
                  "print(greet('x'), shapes.AREA, __name__)\n"},
      {"src/helper.py", "def greet(n):\n    return 'hello ' + n\n"},
      {"lib/shapes.py", "AREA = 6\n"},
  };
  ASSERT_TRUE(py.StageProject(files).has_value());
  Captured c = RunCaptured(py, [&] { return py.ExecuteEntryPoint("main.py"); });
  ASSERT_TRUE(c.status.has_value()) << c.status.error();
  EXPECT_EQ(c.output.out, "hello x 6 __main__\n");
}

TEST_F(PythonInterpreterTest, RestagingReplacesModules) {
  ASSERT_TRUE(py.StageProject({{"main.py", "import conf\nprint(conf.V)\n"},
                               {"conf.py", "V = 1\n"},
                               {"stale.py", ""}})
                  .has_value());
  Captured first =
      RunCaptured(py, [&] { return py.ExecuteEntryPoint("main.py"); });
  ASSERT_TRUE(first.status.has_value()) << first.status.error();
  EXPECT_EQ(first.output.out, "1\n");

  ASSERT_TRUE(py.StageProject({{"main.py", "import conf\nprint(conf.V)\n"},
                               {"conf.py", "V = 2\n"}})
                  .has_value());
  Captured second =
      RunCaptured(py, [&] { return py.ExecuteEntryPoint("main.py"); });
  ASSERT_TRUE(second.status.has_value()) << second.status.error();
  EXPECT_EQ(second.output.out, "2\n");
  EXPECT_FALSE(
      std::filesystem::exists(py.Settings().project_root / "stale.py"));
}

TEST_F(PythonInterpreterTest, MissingEntryPoint) {
  ASSERT_TRUE(py.StageProject({{"main.py", "print(1)\n"}}).has_value());
  Captured c = RunCaptured(py, [&] { return py.ExecuteEntryPoint("app.py"); });
  ASSERT_FALSE(c.status.has_value());
  EXPECT_EQ(c.status.error(), "FileNotFoundError: Entry point not found: app.py");
}

TEST(PythonInterpreterIsolation, SessionsDoNotShareGlobals) {
  engine::PythonInterpreter a{MakeSettings("iso-a")};
  engine::PythonInterpreter b{MakeSettings("iso-b")};
  ASSERT_TRUE(a.Load().has_value());
  ASSERT_TRUE(b.Load().has_value());
  ASSERT_TRUE(RunCaptured(a, [&] { return a.Execute("shared = 1"); })
                  .status.has_value());
  Captured c = RunCaptured(b, [&] { return b.Execute("print(shared)"); });
  ASSERT_FALSE(c.status.has_value());
  EXPECT_NE(c.status.error().find("NameError"), std::string::npos);
}

TEST(PythonInterpreterIsolation, LoadTwiceIsRefused) {
  engine::PythonInterpreter py{MakeSettings("twice")};
  ASSERT_TRUE(py.Load().has_value());
  EXPECT_FALSE(py.Load().has_value());
}

// A runaway loop cannot be stopped: the deadline terminates its session and a
// fresh session on another guest thread keeps working alongside it.
TEST(PythonSupervision, InfiniteLoopTimesOutAndWorkerRecovers) {
  fake::HostLoop host;
  auto supervisor = std::make_shared<Supervisor>(host.Executor());
  auto make_session = [&](std::uint64_t id) {
    return std::make_shared<Session>(
        id, host.Executor(),
        std::make_shared<engine::PythonInterpreter>(
            MakeSettings("sup-" + std::to_string(id))));
  };
  auto load = [&](const std::shared_ptr<Session> &session) {
    std::optional<engine::OpResult> loaded;
    EXPECT_TRUE(session->Transition(SessionState::initializing));
    session->Dispatch<engine::OpResult>(
        [](engine::IInterpreter &interpreter) { return interpreter.Load(); },
        [&](engine::OpResult r) { loaded = std::move(r); });
    EXPECT_TRUE(host.RunUntil([&] { return loaded.has_value(); }, 10s));
    EXPECT_TRUE(loaded.has_value() && loaded->has_value());
    EXPECT_TRUE(session->Transition(SessionState::ready));
  };
  auto run = [&](const std::shared_ptr<Session> &session,
                 const std::string &code, std::chrono::milliseconds timeout) {
    std::optional<ExecutionResult> result;
    auto st = supervisor->Run(
        session,
        [code](engine::IInterpreter &interpreter) {
          return interpreter.Execute(code);
        },
        timeout, [&](ExecutionResult r) { result = std::move(r); });
    EXPECT_TRUE(st.has_value());
    EXPECT_TRUE(host.RunUntil([&] { return result.has_value(); }, 10s));
    return result.value_or(ExecutionResult::Interrupted("no result", 0));
  };

  auto first = make_session(1);
  load(first);
  ExecutionResult looped = run(first, "while True:\n    pass\n", 1000ms);
  EXPECT_EQ(looped.outcome, Outcome::interrupted);
  EXPECT_EQ(looped.error, "Execution timeout");
  EXPECT_GE(looped.execution_time_ms, 1000.0);
  EXPECT_LT(looped.execution_time_ms, 3000.0);
  EXPECT_EQ(first->State(), SessionState::terminated);

  auto second = make_session(2);
  load(second);
  ExecutionResult after = run(second, "print('recovered')", 5000ms);
  EXPECT_EQ(after.outcome, Outcome::success);
  EXPECT_EQ(after.output, "recovered\n");
}
