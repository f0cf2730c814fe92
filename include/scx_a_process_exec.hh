#pragma once

struct exe_c;
struct exe_b;
struct exe_r;
struct exe_i;
class exe_t;

#include <cstdlib>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <unistd.h>
#include <signal.h>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <memory>
#include <future>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <uv.h>
#include <nlohmann/json.hpp>
#include "scx_a_types.hh"
#include "scx_a_thread_pool.hh"

extern char **environ;

/* --------------------------------------------- */

inline constexpr uint64_t EXE_TIMEOUT_MS = 30000;
inline constexpr size_t EXE_OUTPUT_CAP = 10000; // per stream, code points
inline constexpr uint64_t EXE_GRACE_MS = 5000; // SIGTERM -> SIGKILL
inline constexpr std::string_view EXE_TRUNCATED = "\n... (output truncated)";
inline constexpr std::string_view EXE_NO_OUTPUT = "(no output)";

struct exe_c // config
{
  std::string cmd = "python3"; // looked up in PATH
  std::vector<std::string> args = {"-c"}; // script goes last
  std::string dir; // empty = inherit
  std::unordered_map<std::string, std::string> env = {{"PYTHONIOENCODING", "utf-8"}}; // overlaid on environ
  uint64_t timeout_ms = EXE_TIMEOUT_MS; // 0 = no deadline
  size_t output_cap = EXE_OUTPUT_CAP;
  uint64_t grace_ms = EXE_GRACE_MS; // 0 = never escalate to SIGKILL
  exe_c() = default;
  explicit exe_c(const std::string& _cmd) : cmd(_cmd) {}
  exe_c(const std::string& _cmd, uint64_t _timeout_ms, size_t _output_cap = EXE_OUTPUT_CAP, uint64_t _grace_ms = EXE_GRACE_MS)
    : cmd(_cmd), timeout_ms(_timeout_ms), output_cap(_output_cap), grace_ms(_grace_ms) {}
  inline std::string timeout_text_() const // 30000 -> "30", 500 -> "0.5"
  {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%g", static_cast<double>(timeout_ms) / 1000.0);
    return buffer;
  }
};

struct exe_b // one output stream, capped in code points
{
  std::string info;
  size_t cap;
  size_t chars = 0; // code points kept
  uint64_t size = 0; // bytes received, discarded ones included
  bool truncated = false;
  explicit exe_b(size_t _cap = EXE_OUTPUT_CAP) : cap(_cap) {}
  inline void append_(const char* _p, size_t _n)
  {
    size += _n;
    if (truncated) return; // bounded from here on
    const size_t from = info.size();
    info.append(_p, _n);
    for (size_t i = from; i < info.size(); ++i)
    {
      if ((static_cast<unsigned char>(info[i]) & 0xC0) == 0x80) continue; // continuation byte
      if (chars == cap) // lead of the first code point past the cap
      {
        info.resize(i);
        info.append(EXE_TRUNCATED);
        truncated = true;
        return;
      }
      ++chars;
    }
  }
  inline std::string trimmed_() const { return std::string(trim_(info)); }
};

struct exe_r // result
{
  uint64_t id = 0;
  uint8_t status = 0; // 0 = idle; 1 = running; 2 = completed; 3 = timed out; 4 = spawn failed; 5 = cancelled
  bool success = false;
  std::optional<std::string> output;
  std::optional<std::string> error;
  uint64_t elapsed_ms = 0;
  int64_t exit_code = -1;
  int exit_sign = 0;
  uint64_t stdout_size = 0;
  uint64_t stderr_size = 0;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  inline nlohmann::json to_json_() const // wire shape
  {
    nlohmann::json j = {{"success", success}};
    if (output) j["output"] = *output;
    if (error) j["error"] = *error;
    j["executionTime"] = elapsed_ms;
    return j;
  }
};

struct exe_i // invocation: owns process, pipes, timer and buffers of one call
{
  using done_f = std::function<void(exe_r&&)>;
  exe_t* engine;
  uint64_t id;
  exe_c config;
  std::string script;
  done_f done; // emptied when the call resolves
  uint8_t status = 0; // see exe_r::status
  uv_process_t process;
  uv_pipe_t out_pipe;
  uv_pipe_t err_pipe;
  uv_timer_t timer;
  exe_b out;
  exe_b err;
  std::chrono::steady_clock::time_point init_time;
  bool exited = false;
  bool out_open = false;
  bool err_open = false;
  int64_t exit_code = -1;
  int exit_sign = 0;
  int handles = 0; // uv handles not yet closed
  char chunk[65536]; // shared by both pipes: the loop reads one stream at a time
  exe_i(exe_t* _engine, uint64_t _id, std::string _script, const exe_c& _config, done_f _done)
    : engine(_engine), id(_id), config(_config), script(std::move(_script)), done(std::move(_done))
    , out(_config.output_cap), err(_config.output_cap), init_time(std::chrono::steady_clock::now()) {}
  exe_i(const exe_i&) = delete;
  exe_i& operator=(const exe_i&) = delete;
};

/* --------------------------------------------- */

class exe_t // engine: one libuv loop thread drives every invocation
{ // launch_() -> inbox -> on_wake_() -> start_() -> on_read_()/on_exit_()/on_deadline_() -> settle_() -> on_close_() -> delete
public:
  std::atomic<uint64_t> this_id = {0};
  std::atomic<uint8_t> state = {0}; // 0 = finalized; 1 = running; 2 = stopping
  std::atomic<size_t> live_n = {0};
  exe_c defaults;
  uv_loop_t loop;
  uv_async_t wake;
  std::thread loop_t;
  std::mutex gate; // orders launch_() against fina_()
  pth_q<std::unique_ptr<exe_i>> inbox;
  std::unordered_set<exe_i*> live; // loop thread only
  explicit exe_t(const exe_c& _defaults = exe_c()) : defaults(_defaults) { init_(); }
  ~exe_t() { fina_(); } // never from a callback: fina_() refuses there
  exe_t(const exe_t&) = delete;
  exe_t& operator=(const exe_t&) = delete;
  exe_t(exe_t&&) = delete;
  exe_t& operator=(exe_t&&) = delete;
  inline void init_()
  {
    if (state.load() != 0) return;
    int r = uv_loop_init(&loop);
    if (r != 0) throw std::runtime_error(std::string("exe_t.init_(): Failed to uv_loop_init() w/ ") + uv_strerror(r));
    r = uv_async_init(&loop, &wake, on_wake_);
    if (r != 0)
    {
      uv_loop_close(&loop);
      throw std::runtime_error(std::string("exe_t.init_(): Failed to uv_async_init() w/ ") + uv_strerror(r));
    }
    wake.data = this;
    this_id.store(1);
    state.store(1);
    loop_t = std::thread([this]() { uv_run(&loop, UV_RUN_DEFAULT); });
  }
  // 0 = finalized; -1 = refused: the engine thread cannot join itself, so callbacks must not destroy the engine
  inline short fina_() // cancels live invocations, then joins the loop thread
  {
    if (loop_t.joinable() && loop_t.get_id() == std::this_thread::get_id())
    {
      fprintf(stderr, "exe_t.fina_() [%d]: called from the engine thread, refused\n", getpid());
      return -1;
    }
    {
      std::lock_guard<std::mutex> lock(gate);
      uint8_t expected = 1;
      if (!state.compare_exchange_strong(expected, 2)) return 0;
      uv_async_send(&wake);
    }
    if (loop_t.joinable()) loop_t.join();
    while (auto inv = inbox.pop_front()) cancel_(std::move(*inv));
    int r = uv_loop_close(&loop);
    if (r != 0) fprintf(stderr, "exe_t.fina_() [%d]: uv_loop_close() w/ %s\n", getpid(), uv_strerror(r));
    state.store(0);
    return 0;
  }
  inline size_t live_() const noexcept { return live_n.load(); }
  inline void launch_(std::string _script, const exe_c& _config, exe_i::done_f _done) // _done runs exactly once
  {
    auto inv = std::make_unique<exe_i>(this, this_id.fetch_add(1), std::move(_script), _config, std::move(_done));
    {
      std::lock_guard<std::mutex> lock(gate);
      if (state.load() == 1)
      {
        inbox.push_back(std::move(inv));
        uv_async_send(&wake);
        return;
      }
    }
    cancel_(std::move(inv));
  }
  inline void launch_(std::string _script, exe_i::done_f _done) { launch_(std::move(_script), defaults, std::move(_done)); }
  inline std::future<exe_r> run_(std::string _script, const exe_c& _config)
  {
    auto shared_promise = std::make_shared<std::promise<exe_r>>();
    auto future = shared_promise->get_future();
    launch_(std::move(_script), _config, [promise = shared_promise](exe_r&& _r) { promise->set_value(std::move(_r)); });
    return future;
  }
  inline std::future<exe_r> run_(std::string _script) { return run_(std::move(_script), defaults); }
private:
  static inline std::vector<std::string> environ_(const std::unordered_map<std::string, std::string>& _overlay)
  {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e)
    {
      std::string_view kv(*e);
      if (_overlay.count(std::string(kv.substr(0, kv.find('=')))) > 0) continue;
      env.emplace_back(kv);
    }
    for (const auto& [key, value] : _overlay) env.push_back(key + "=" + value);
    return env;
  }
  static inline void on_wake_(uv_async_t* _wake)
  {
    auto* self = static_cast<exe_t*>(_wake->data);
    const bool stopping = self->state.load() != 1;
    while (auto inv = self->inbox.pop_front())
    {
      if (stopping) self->cancel_(std::move(*inv));
      else self->start_(std::move(*inv));
    }
    if (!stopping) return;
    std::vector<exe_i*> snapshot(self->live.begin(), self->live.end());
    for (auto* inv : snapshot)
    {
      if (inv->status == 1) self->abort_(inv, SIGKILL, 5, "Execution cancelled: engine shutting down");
      else if (!inv->exited) self->signal_(inv, SIGKILL);
    }
    uv_close(reinterpret_cast<uv_handle_t*>(&self->wake), NULL); // loop ends once the last invocation is released
  }
  inline void start_(std::unique_ptr<exe_i> _inv)
  {
    exe_i* inv = _inv.release(); // owned by its uv handles from here: freed in on_close_()
    live.insert(inv);
    live_n.fetch_add(1);
    // 1. handles
    uv_pipe_init(&loop, &inv->out_pipe, 0);
    uv_pipe_init(&loop, &inv->err_pipe, 0);
    uv_timer_init(&loop, &inv->timer);
    inv->out_pipe.data = inv;
    inv->err_pipe.data = inv;
    inv->timer.data = inv;
    inv->process.data = inv;
    inv->handles = 3;
    // 2. argv: cmd args... script
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(inv->config.cmd.c_str()));
    for (const auto& arg : inv->config.args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(const_cast<char*>(inv->script.c_str()));
    argv.push_back(NULL);
    // 3. envp: inherited plus overlay
    std::vector<std::string> env_storage = environ_(inv->config.env);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& e : env_storage) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(NULL);
    // 4. stdio: no stdin, stdout/stderr into our pipes
    uv_stdio_container_t stdio[3];
    stdio[0].flags = UV_IGNORE;
    stdio[1].flags = static_cast<uv_stdio_flags>(UV_CREATE_PIPE | UV_WRITABLE_PIPE);
    stdio[1].data.stream = reinterpret_cast<uv_stream_t*>(&inv->out_pipe);
    stdio[2].flags = static_cast<uv_stdio_flags>(UV_CREATE_PIPE | UV_WRITABLE_PIPE);
    stdio[2].data.stream = reinterpret_cast<uv_stream_t*>(&inv->err_pipe);
    uv_process_options_t options;
    memset(&options, 0, sizeof(options));
    options.exit_cb = on_exit_;
    options.file = inv->config.cmd.c_str();
    options.args = argv.data();
    options.env = envp.data();
    options.cwd = inv->config.dir.empty() ? NULL : inv->config.dir.c_str();
    options.flags = UV_PROCESS_DETACHED; // own session: deadline signals reach the interpreter's children
    options.stdio_count = 3;
    options.stdio = stdio;
    // 5. spawn
    inv->init_time = std::chrono::steady_clock::now();
    int r = uv_spawn(&loop, &inv->process, &options);
    inv->handles++; // process handle is closed on failure too
    if (r != 0)
    {
      fprintf(stderr, "exe_t.start_() [%d]: #%lu spawn %s w/ %s\n", getpid(), static_cast<unsigned long>(inv->id), inv->config.cmd.c_str(), uv_strerror(r));
      inv->status = 4;
      exe_r result = result_(inv);
      result.error = "Failed to execute: spawn " + inv->config.cmd + " " + uv_err_name(r) + " (" + uv_strerror(r) + ")";
      settle_(inv, std::move(result));
      close_(&inv->out_pipe);
      close_(&inv->err_pipe);
      close_(&inv->timer);
      close_(&inv->process);
      return;
    }
    inv->status = 1;
    // 6. read both streams, arm the deadline
    inv->out_open = uv_read_start(reinterpret_cast<uv_stream_t*>(&inv->out_pipe), on_alloc_, on_read_) == 0;
    inv->err_open = uv_read_start(reinterpret_cast<uv_stream_t*>(&inv->err_pipe), on_alloc_, on_read_) == 0;
    if (!inv->out_open) close_(&inv->out_pipe);
    if (!inv->err_open) close_(&inv->err_pipe);
    if (inv->config.timeout_ms > 0) uv_timer_start(&inv->timer, on_deadline_, inv->config.timeout_ms, 0);
  }
  static inline void on_alloc_(uv_handle_t* _handle, size_t _suggested, uv_buf_t* _buf)
  {
    auto* inv = static_cast<exe_i*>(_handle->data);
    *_buf = uv_buf_init(inv->chunk, sizeof(inv->chunk));
  }
  static inline void on_read_(uv_stream_t* _stream, ssize_t _nread, const uv_buf_t* _buf)
  {
    auto* inv = static_cast<exe_i*>(_stream->data);
    const bool is_out = _stream == reinterpret_cast<uv_stream_t*>(&inv->out_pipe);
    if (_nread > 0)
    {
      (is_out ? inv->out : inv->err).append_(_buf->base, static_cast<size_t>(_nread));
      return;
    }
    if (_nread == 0) return; // EAGAIN
    if (_nread != UV_EOF) fprintf(stderr, "exe_t.on_read_() [%d]: #%lu %s w/ %s\n", getpid(), static_cast<unsigned long>(inv->id), is_out ? "stdout" : "stderr", uv_strerror(static_cast<int>(_nread)));
    (is_out ? inv->out_open : inv->err_open) = false;
    close_(_stream);
    inv->engine->complete_(inv);
  }
  static inline void on_exit_(uv_process_t* _process, int64_t _exit_status, int _term_signal)
  {
    auto* inv = static_cast<exe_i*>(_process->data);
    inv->exited = true;
    inv->exit_code = _exit_status;
    inv->exit_sign = _term_signal;
    close_(_process);
    if (inv->status == 1) inv->engine->complete_(inv);
    else close_(&inv->timer); // grace timer no longer needed
  }
  static inline void on_deadline_(uv_timer_t* _timer)
  {
    auto* inv = static_cast<exe_i*>(_timer->data);
    if (inv->status != 1) // grace expired: SIGTERM was not enough
    {
      if (!inv->exited)
      {
        fprintf(stderr, "exe_t.on_deadline_() [%d]: #%lu ignored SIGTERM, sending SIGKILL\n", getpid(), static_cast<unsigned long>(inv->id));
        inv->engine->signal_(inv, SIGKILL);
      }
      return;
    }
    inv->engine->abort_(inv, SIGTERM, 3, "Execution timed out after " + inv->config.timeout_text_() + " seconds");
  }
  static inline void on_close_(uv_handle_t* _handle)
  {
    auto* inv = static_cast<exe_i*>(_handle->data);
    if (--inv->handles > 0) return;
    exe_t* self = inv->engine;
    self->live.erase(inv);
    self->live_n.fetch_sub(1);
    delete inv;
  }
  template <typename H>
  static inline void close_(H* _handle)
  {
    auto* handle = reinterpret_cast<uv_handle_t*>(_handle);
    if (uv_is_closing(handle) == 0) uv_close(handle, on_close_);
  }
  static inline void signal_(exe_i* _inv, int _signum)
  {
    int r = uv_kill(-_inv->process.pid, _signum); // whole process group, the leader may be gone already
    if (r == 0 || r == UV_ESRCH) return;
    if (!_inv->exited) r = uv_process_kill(&_inv->process, _signum);
    if (r != 0 && r != UV_ESRCH)
    {
      fprintf(stderr, "exe_t.signal_() [%d]: #%lu signal %d w/ %s\n", getpid(), static_cast<unsigned long>(_inv->id), _signum, uv_strerror(r));
    }
  }
  inline void complete_(exe_i* _inv) // Running -> Completed once the process exited and both streams drained
  {
    if (_inv->status != 1 || !_inv->exited || _inv->out_open || _inv->err_open) return;
    _inv->status = 2;
    uv_timer_stop(&_inv->timer);
    exe_r result = result_(_inv);
    if (_inv->exit_sign == 0 && _inv->exit_code == 0)
    {
      std::string out = _inv->out.trimmed_();
      result.success = true;
      result.output = out.empty() ? std::string(EXE_NO_OUTPUT) : out;
    }
    else
    {
      std::string out = _inv->out.trimmed_();
      std::string err = _inv->err.trimmed_();
      if (!out.empty()) result.output = out;
      if (!err.empty()) result.error = err;
      else if (_inv->exit_sign != 0) result.error = "Process terminated by signal " + std::to_string(_inv->exit_sign);
      else result.error = "Process exited with code " + std::to_string(_inv->exit_code);
    }
    settle_(_inv, std::move(result));
    close_(&_inv->timer);
  }
  inline void abort_(exe_i* _inv, int _signum, uint8_t _status, const std::string& _error) // Running -> TimedOut / Cancelled
  {
    _inv->status = _status;
    signal_(_inv, _signum);
    exe_r result = result_(_inv);
    result.error = _error;
    settle_(_inv, std::move(result));
    if (_inv->out_open) { _inv->out_open = false; close_(&_inv->out_pipe); }
    if (_inv->err_open) { _inv->err_open = false; close_(&_inv->err_pipe); }
    if (_inv->exited) close_(&_inv->timer);
    else if (_signum != SIGKILL && _inv->config.grace_ms > 0) uv_timer_start(&_inv->timer, on_deadline_, _inv->config.grace_ms, 0);
    else uv_timer_stop(&_inv->timer);
  }
  inline exe_r result_(const exe_i* _inv) const
  {
    exe_r result;
    result.id = _inv->id;
    result.status = _inv->status;
    result.elapsed_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - _inv->init_time).count());
    result.exit_code = _inv->exit_code;
    result.exit_sign = _inv->exit_sign;
    result.stdout_size = _inv->out.size;
    result.stderr_size = _inv->err.size;
    result.stdout_truncated = _inv->out.truncated;
    result.stderr_truncated = _inv->err.truncated;
    return result;
  }
  static inline void settle_(exe_i* _inv, exe_r&& _result)
  {
    exe_i::done_f done = std::move(_inv->done);
    _inv->done = nullptr;
    if (!done) return;
    try { done(std::move(_result)); }
    catch (const std::exception& e) { fprintf(stderr, "exe_t.settle_() [%d]: #%lu callback threw: %s\n", getpid(), static_cast<unsigned long>(_inv->id), e.what()); }
    catch (...) { fprintf(stderr, "exe_t.settle_() [%d]: #%lu callback threw a non-standard exception\n", getpid(), static_cast<unsigned long>(_inv->id)); }
  }
  static inline void cancel_(std::unique_ptr<exe_i> _inv) // never reached the loop
  {
    _inv->status = 5;
    exe_r result;
    result.id = _inv->id;
    result.status = 5;
    result.error = "Execution cancelled: engine shutting down";
    settle_(_inv.get(), std::move(result));
  }
};

/* --------------------------------------------- */
