#include <boost/python.hpp>

#include "engine/python_interpreter.hpp"
#include "engine/project_files.hpp"
#include "logging/console.hpp"
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <utility>

namespace bp = boost::python;

namespace engine {

namespace {

// Installed into a private module namespace of every sub-interpreter. The
// guest never sees these names: its __main__ is a separate dict.
constexpr const char *kBootstrap = R"PY(
import io
import importlib
import os
import sys
import traceback


class _OutputCapture:
    def __init__(self):
        self.stdout = io.StringIO()
        self.stderr = io.StringIO()

    def clear(self):
        self.stdout = io.StringIO()
        self.stderr = io.StringIO()

    def capture(self):
        sys.stdout = self.stdout
        sys.stderr = self.stderr

    def release(self):
        sys.stdout = sys.__stdout__
        sys.stderr = sys.__stderr__

    # UTF-8 bytes; lone surrogates are escaped instead of failing the read
    def read(self):
        return tuple(
            stream.getvalue().encode("utf-8", "backslashreplace")
            for stream in (self.stdout, self.stderr)
        )


_capture = _OutputCapture()


def _format_error(exc):
    tb = exc.__traceback__
    if tb is not None:
        tb = tb.tb_next
    lines = traceback.format_exception(type(exc), exc, tb)
    return "".join(lines).rstrip("\n")


def _run_source(source, filename, namespace):
    try:
        exec(compile(source, filename, "exec"), namespace)
    except BaseException as exc:
        return _format_error(exc)
    return None


def _forget_modules_under(root):
    prefix = os.path.join(root, "")
    for name, module in list(sys.modules.items()):
        path = getattr(module, "__file__", None) or ""
        if path.startswith(prefix):
            del sys.modules[name]


def _add_search_paths(paths):
    for path in reversed(paths):
        if os.path.isdir(path) and path not in sys.path:
            sys.path.insert(0, path)
    importlib.invalidate_caches()


def _run_entry_point(root, entry):
    path = os.path.join(root, entry)
    if not os.path.isfile(path):
        return "FileNotFoundError: Entry point not found: " + entry
    with open(path, encoding="utf-8") as handle:
        source = handle.read()
    namespace = {
        "__name__": "__main__",
        "__file__": path,
        "__builtins__": __builtins__,
    }
    return _run_source(source, path, namespace)


def _install(target, packages):
    try:
        from pip._internal.cli.main import main as pip_main
    except BaseException as exc:
        return "pip is not available: " + repr(exc)
    try:
        code = pip_main(["install", "--disable-pip-version-check",
                         "--no-input", "--target", target] + list(packages))
    except SystemExit as exc:
        code = exc.code
    except BaseException as exc:
        return _format_error(exc)
    if code:
        return "pip install failed with exit code " + str(code)
    _add_search_paths([target])
    return None
)PY";

// CPython is started once per process and never finalized: abandoned
// sub-interpreters may still be running guest code at exit.
void EnsurePythonStarted() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (Py_IsInitialized()) {
      return;
    }
    Py_InitializeEx(0);
    // drop the GIL so any thread can create a sub-interpreter
    PyEval_SaveThread();
  });
}

// Holds the GIL as `tstate` for the lifetime of the scope.
class ThreadStateScope {
public:
  explicit ThreadStateScope(PyThreadState *tstate) {
    PyEval_RestoreThread(tstate);
  }
  ~ThreadStateScope() { PyEval_SaveThread(); }

  ThreadStateScope(const ThreadStateScope &) = delete;
  ThreadStateScope &operator=(const ThreadStateScope &) = delete;
};

// Current Python exception as "Type: message"; clears it.
std::string FetchPythonError() {
  PyObject *type = nullptr;
  PyObject *value = nullptr;
  PyObject *trace = nullptr;
  PyErr_Fetch(&type, &value, &trace);
  if (type == nullptr) {
    return "unknown Python error";
  }
  PyErr_NormalizeException(&type, &value, &trace);
  bp::handle<> htype(type);
  bp::handle<> hvalue(bp::allow_null(value));
  bp::handle<> htrace(bp::allow_null(trace));

  std::string text = PyExceptionClass_Name(htype.get());
  if (hvalue) {
    PyObject *str = PyObject_Str(hvalue.get());
    if (str != nullptr) {
      const char *utf8 = PyUnicode_AsUTF8(str);
      if (utf8 != nullptr && *utf8 != '\0') {
        text += ": ";
        text += utf8;
      }
      Py_DECREF(str);
    }
    PyErr_Clear();
  }
  return text;
}

// `sub` must be current with the GIL held; returns with the GIL released.
void EndSubInterpreter(PyThreadState *sub) {
  Py_EndInterpreter(sub);
  // Py_EndInterpreter leaves the GIL held with no current thread state
  PyThreadState *scratch = PyThreadState_New(PyInterpreterState_Main());
  PyThreadState_Swap(scratch);
  PyThreadState_Clear(scratch);
  PyThreadState_DeleteCurrent();
}

OpResult ToOpResult(const bp::object &returned) {
  if (returned.is_none()) {
    return {};
  }
  bp::extract<std::string> text(returned);
  if (!text.check()) {
    return std::unexpected(std::string("guest error (unprintable)"));
  }
  return std::unexpected(text());
}

} // namespace

struct PythonInterpreter::State {
  PyThreadState *tstate = nullptr;
  bp::object tools;
  bp::object capture;
  bp::object main_namespace;
};

PythonInterpreter::PythonInterpreter(PythonSettings settings)
    : settings_(std::move(settings)), output_(*this) {}

PythonInterpreter::~PythonInterpreter() {
  if (!state_) {
    return;
  }
  if (std::this_thread::get_id() != owner_) {
    logging::Console("python",
                     "destroyed off its thread, sub-interpreter leaked");
    (void)state_.release();
    return;
  }
  Unload();
}

OpResult PythonInterpreter::Load() {
  if (state_) {
    return std::unexpected(std::string("interpreter already loaded"));
  }
  std::error_code ec;
  std::filesystem::create_directories(settings_.packages_dir, ec);
  if (ec) {
    return std::unexpected("cannot create " + settings_.packages_dir.string() +
                           ": " + ec.message());
  }

  EnsurePythonStarted();
  PyThreadState *boot = PyThreadState_New(PyInterpreterState_Main());
  PyEval_RestoreThread(boot);
  PyThreadState *sub = Py_NewInterpreter();
  PyThreadState_Swap(boot);
  PyThreadState_Clear(boot);
  PyThreadState_DeleteCurrent();
  if (sub == nullptr) {
    return std::unexpected(std::string("Py_NewInterpreter failed"));
  }

  owner_ = std::this_thread::get_id();
  std::string failure;
  {
    ThreadStateScope scope(sub);
    auto state = std::make_unique<State>();
    state->tstate = sub;
    try {
      bp::dict tools;
      tools["__builtins__"] = bp::import("builtins");
      tools["__name__"] = "_codeworker";
      bp::exec(kBootstrap, tools, tools);
      bp::list paths;
      paths.append(settings_.packages_dir.string());
      tools["_add_search_paths"](paths);
      state->capture = tools["_capture"];
      state->main_namespace = bp::import("__main__").attr("__dict__");
      state->tools = tools;
      state_ = std::move(state);
    } catch (const bp::error_already_set &) {
      failure = FetchPythonError();
    }
  }
  if (!state_) {
    PyEval_RestoreThread(sub);
    EndSubInterpreter(sub);
    return std::unexpected("bootstrap failed: " + failure);
  }
  logging::Console("python", "sub-interpreter ready");
  return {};
}

template <typename... Args>
OpResult PythonInterpreter::CallTool(const char *name, Args &&...args) {
  if (!state_) {
    return std::unexpected(std::string("interpreter not loaded"));
  }
  ThreadStateScope scope(state_->tstate);
  try {
    bp::object tool = state_->tools[name];
    return ToOpResult(tool(std::forward<Args>(args)...));
  } catch (const bp::error_already_set &) {
    return std::unexpected(FetchPythonError());
  }
}

OpResult PythonInterpreter::Execute(const std::string &code) {
  if (!state_) {
    return std::unexpected(std::string("interpreter not loaded"));
  }
  return CallTool("_run_source", code, std::string("<string>"),
                  state_->main_namespace);
}

OpResult PythonInterpreter::StageProject(const std::vector<SourceFile> &files) {
  namespace fs = std::filesystem;
  if (!state_) {
    return std::unexpected(std::string("interpreter not loaded"));
  }
  const fs::path &root = settings_.project_root;
  std::error_code ec;
  fs::remove_all(root, ec);
  if (ec) {
    return std::unexpected("cannot clear project directory: " + ec.message());
  }
  fs::create_directories(root, ec);
  if (ec) {
    return std::unexpected("cannot create project directory: " + ec.message());
  }
  for (const auto &file : files) {
    const fs::path target = root / file.path;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      return std::unexpected("cannot create directory for " + file.path + ": " +
                             ec.message());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(file.content.data(),
              static_cast<std::streamsize>(file.content.size()));
    if (!out) {
      return std::unexpected("cannot write " + file.path);
    }
  }

  ThreadStateScope scope(state_->tstate);
  try {
    state_->tools["_forget_modules_under"](root.string());
    bp::list paths;
    paths.append(root.string());
    for (const auto &sub : ProjectSearchDirs()) {
      paths.append((root / sub).string());
    }
    state_->tools["_add_search_paths"](paths);
  } catch (const bp::error_already_set &) {
    return std::unexpected(FetchPythonError());
  }
  return {};
}

OpResult PythonInterpreter::ExecuteEntryPoint(const std::string &entry_point) {
  return CallTool("_run_entry_point", settings_.project_root.string(),
                  entry_point);
}

OpResult PythonInterpreter::Install(const std::vector<std::string> &packages) {
  if (!state_) {
    return std::unexpected(std::string("interpreter not loaded"));
  }
  ThreadStateScope scope(state_->tstate);
  try {
    bp::list names;
    for (const auto &package : packages) {
      names.append(package);
    }
    bp::object tool = state_->tools["_install"];
    return ToOpResult(tool(settings_.packages_dir.string(), names));
  } catch (const bp::error_already_set &) {
    return std::unexpected(FetchPythonError());
  }
}

void PythonInterpreter::Unload() {
  PyThreadState *sub = state_->tstate;
  PyEval_RestoreThread(sub);
  state_->capture = bp::object();
  state_->main_namespace = bp::object();
  state_->tools = bp::object();
  state_.reset();

  // Guest threads still attached: ending the interpreter would abort the
  // process, so it is left behind.
  PyInterpreterState *interp = PyThreadState_GetInterpreter(sub);
  if (PyInterpreterState_ThreadHead(interp) != sub ||
      PyThreadState_Next(sub) != nullptr) {
    logging::Console("python", "guest threads alive, sub-interpreter leaked");
    PyEval_SaveThread();
    return;
  }
  EndSubInterpreter(sub);
}

void PythonOutput::Clear() {
  auto &state = owner_.state_;
  if (!state) {
    return;
  }
  ThreadStateScope scope(state->tstate);
  try {
    state->capture.attr("clear")();
  } catch (const bp::error_already_set &) {
    logging::Console("python", "capture clear: " + FetchPythonError());
  }
}

void PythonOutput::Capture() {
  auto &state = owner_.state_;
  if (!state) {
    return;
  }
  ThreadStateScope scope(state->tstate);
  try {
    state->capture.attr("capture")();
  } catch (const bp::error_already_set &) {
    logging::Console("python", "capture start: " + FetchPythonError());
  }
}

void PythonOutput::Release() {
  auto &state = owner_.state_;
  if (!state) {
    return;
  }
  ThreadStateScope scope(state->tstate);
  try {
    state->capture.attr("release")();
  } catch (const bp::error_already_set &) {
    logging::Console("python", "capture release: " + FetchPythonError());
  }
}

capture::CapturedOutput PythonOutput::Read() {
  auto &state = owner_.state_;
  capture::CapturedOutput captured;
  if (!state) {
    return captured;
  }
  ThreadStateScope scope(state->tstate);
  try {
    bp::object streams = state->capture.attr("read")();
    captured.out = bp::extract<std::string>(streams[0])();
    captured.err = bp::extract<std::string>(streams[1])();
  } catch (const bp::error_already_set &) {
    logging::Console("python", "capture read: " + FetchPythonError());
  }
  return captured;
}

} // namespace engine
