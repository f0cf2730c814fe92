#pragma once

#include <nlohmann/json.hpp>
#include "scx_a_types.hh"
#include "scx_a_thread_pool.hh"

struct http_m;
struct http_q;
struct http_d;
struct http_g;
struct http_s;
class scx_a;

#include <cstdlib>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <unistd.h>
#include <signal.h>
#include <iostream>
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <string_view>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <uv.h>
#include <h2o.h>
#include <h2o/http1.h>
#include <h2o/http2.h>

/* --------------------------------------------- */

struct http_m // method
{
  enum value : uint8_t
  {
    NONE = 0,
    GET = 1,
    POST = 2,
    PUT = 3,
    DELETE = 4,
    PATCH = 5,
    OPTIONS = 6,
    HEAD = 7
  };
  value v;
  constexpr http_m() noexcept : v(NONE) {}
  constexpr http_m(value val) noexcept : v(val) {}
  http_m(std::string_view str) noexcept : v(method_(str)) {}
  constexpr operator value() const noexcept { return v; } // use as enum e.g. http_m::GET
  explicit operator bool() = delete; // ban if(http_m)
  static inline value method_(std::string_view str) noexcept
  {
    if (str == "GET") return GET;
    if (str == "POST") return POST;
    if (str == "PUT") return PUT;
    if (str == "DELETE") return DELETE;
    if (str == "PATCH") return PATCH;
    if (str == "OPTIONS") return OPTIONS;
    if (str == "HEAD") return HEAD;
    return NONE;
  }
};
namespace std
{
  template <>
  struct hash<http_m>
  {
    std::size_t operator()(const http_m& m) const noexcept { return static_cast<std::size_t>(m.v); }
  };
}

/* --------------------------------------------- */

using http_f = std::function<void(const http_q&, http_s&)>; // business

struct http_q // request, copied out of the h2o pool: async handlers may outlive the request
{
  std::string method; // "POST"
  std::string url; // "/api/execute?x=1"
  std::unordered_map<std::string, std::string> headers; // h2o already lowercased
  std::string body;
  http_q() = default;
  explicit http_q(const h2o_req_t* _h2o_request) { init_(_h2o_request); }
  inline void init_(const h2o_req_t* _h2o_request)
  {
    method.assign(_h2o_request->method.base, _h2o_request->method.len);
    url.assign(_h2o_request->path.base, _h2o_request->path.len);
    headers.clear();
    headers.reserve(_h2o_request->headers.size);
    for (size_t i = 0; i < _h2o_request->headers.size; ++i)
    {
      const auto& h = _h2o_request->headers.entries[i];
      headers.emplace(std::string(h.name->base, h.name->len), std::string(h.value.base, h.value.len));
    }
    size_t size = _h2o_request->entity.len == SIZE_MAX ? 0 : _h2o_request->entity.len;
    if (_h2o_request->entity.base) body.assign(_h2o_request->entity.base, size);
    else body.clear();
  }
  inline std::string header_(std::string_view _key) const
  {
    auto it = headers.find(std::string(_key));
    if (it != headers.end()) return it->second;
    return std::string();
  }
  inline bool header_has_(std::string_view _key) const { return headers.find(std::string(_key)) != headers.end(); }
};

struct http_d // link between a pending response and whichever thread finishes it
{
  std::mutex m;
  http_g* gen = NULL; // NULL once the response went out or the client is gone
};

struct http_g // generator of an async or deferred response
{
  h2o_generator_t super;
  h2o_req_t* req = NULL;
  h2o_timer_t timer;
  uv_async_t* notify = NULL; // heap: outlives the request pool until its close callback
  dat_t body_data;
  std::atomic<bool> sent{false};
  std::atomic<bool> completed{false};
  std::atomic<bool> is_failing{false};
  std::atomic<bool> is_timeout{false};
  std::shared_ptr<http_d> link;
  ~http_g() { detach_(); }
  inline void detach_()
  {
    if (!link) return;
    std::lock_guard<std::mutex> lock(link->m);
    link->gen = NULL;
  }
  inline void release_() // loop thread only
  {
    if (h2o_timer_is_linked(&timer)) h2o_timer_unlink(&timer);
    if (notify)
    {
      uv_close(reinterpret_cast<uv_handle_t*>(notify), [](uv_handle_t* handle) { delete reinterpret_cast<uv_async_t*>(handle); });
      notify = NULL;
    }
  }
  static inline void on_notify_(uv_async_t* _notify)
  {
    auto* generator = static_cast<http_g*>(_notify->data);
    proceed_(&generator->super, generator->req);
  }
  static inline void on_timeout_(h2o_timer_t* _entry)
  {
    auto* generator = H2O_STRUCT_FROM_MEMBER(http_g, timer, _entry);
    generator->detach_(); // writers arriving from now on are dropped
    if (generator->completed.load()) return; // finished just in time, notify is on its way
    generator->body_data = dat_t(NULL, 0);
    generator->is_failing.store(true);
    generator->is_timeout.store(true);
    generator->completed.store(true);
    proceed_(&generator->super, generator->req);
  }
  static inline void proceed_(h2o_generator_t* _self, h2o_req_t* _req)
  {
    auto* generator = reinterpret_cast<http_g*>(_self);
    if (!generator->completed.load()) return;
    bool expected = false;
    if (!generator->sent.compare_exchange_strong(expected, true)) return;
    generator->detach_();
    generator->release_();
    h2o_iovec_t body = h2o_iovec_init(NULL, 0);
    if (generator->is_timeout.load())
    {
      _req->res.status = 504;
      _req->res.reason = "Gateway Timeout";
    }
    else if (generator->is_failing.load())
    {
      _req->res.status = 500;
      _req->res.reason = "Execute Failure";
    }
    else
    {
      if (_req->res.status == 0)
      {
        _req->res.status = 200;
        _req->res.reason = "OK";
      }
      body = h2o_iovec_init(generator->body_data.p, generator->body_data.b); // copied into the request pool by http_s
    }
    h2o_send(_req, &body, 1, H2O_SEND_STATE_FINAL);
    generator->~http_g();
  }
  static inline void stop_(h2o_generator_t* _self, h2o_req_t* _req) // client gone before the response
  {
    auto* generator = reinterpret_cast<http_g*>(_self);
    generator->detach_(); // before notify is closed: done_() sends to it under the link lock
    generator->release_();
    generator->~http_g();
  }
};

struct http_s // response
{
  h2o_req_t* h2o_request = NULL;
  dat_t data;
  bool async = false;
  bool deferred = false;
  std::shared_ptr<http_d> link; // async only
  http_s(h2o_req_t* _h2o_request, bool _async, std::shared_ptr<http_d> _link = nullptr)
    : h2o_request(_h2o_request), async(_async), link(std::move(_link)) {}
  // R0. guard: async writers touch the request only while it is alive
  template <typename F>
  inline bool live_(F&& _f)
  {
    if (!async)
    {
      _f(static_cast<http_g*>(NULL));
      return true;
    }
    std::lock_guard<std::mutex> lock(link->m);
    if (!link->gen) return false;
    _f(link->gen);
    return true;
  }
  // R1. status
  static inline const char* reason_(int _code) noexcept
  {
    switch (_code)
    {
      case 200: return "OK";
      case 201: return "Created";
      case 202: return "Accepted";
      case 204: return "No Content";
      case 400: return "Bad Request";
      case 404: return "Not Found";
      case 405: return "Method Not Allowed";
      case 413: return "Payload Too Large";
      case 415: return "Unsupported Media Type";
      case 500: return "Internal Server Error";
      case 503: return "Service Unavailable";
      case 504: return "Gateway Timeout";
      default:  return "";
    }
  }
  inline bool status_(int _code)
  {
    return live_([&](http_g*)
    {
      h2o_request->res.status = _code;
      h2o_request->res.reason = reason_(_code);
    });
  }
  // R2. headers
  inline bool header_type_(const std::string& _type, const std::string& _charset = "utf-8")
  {
    return live_([&](http_g*)
    {
      std::string value = _type + "; charset=" + _charset;
      h2o_iovec_t rcy_value = h2o_strdup(&h2o_request->pool, value.data(), value.size());
      h2o_set_header(&h2o_request->pool, &h2o_request->res.headers, H2O_TOKEN_CONTENT_TYPE, rcy_value.base, rcy_value.len, 1);
    });
  }
  inline bool header_json_() { return header_type_("application/json"); }
  // R3. body
  inline void body_(const std::string& _string) { data = dat_t(const_cast<char*>(_string.data()), _string.size()); }
  // R4. send
  inline bool send_() { return send_(data); }
  inline bool send_(const dat_t& _data)
  {
    return live_([&](http_g* _gen)
    {
      void* buffer = _data.b > 0 ? h2o_mem_alloc_pool(&h2o_request->pool, char, _data.b) : NULL;
      if (_data.b > 0)
      {
        if (!buffer) throw std::runtime_error("http_s.send_(): Failed to h2o_mem_alloc_pool() for " + std::to_string(_data.b) + " bytes.");
        memcpy(buffer, _data.p, _data.b);
      }
      if (_gen) // async: the loop sends in http_g::proceed_()
      {
        _gen->body_data = dat_t(buffer, _data.b);
        return;
      }
      if (h2o_request->res.status == 0)
      {
        h2o_request->res.status = 200;
        h2o_request->res.reason = "OK";
      }
      h2o_iovec_t body = h2o_iovec_init(buffer, _data.b);
      static h2o_generator_t sync_gen = {NULL, NULL};
      h2o_start_response(h2o_request, &sync_gen);
      h2o_send(h2o_request, &body, 1, H2O_SEND_STATE_FINAL);
    });
  }
  inline bool send_(const std::string& _string) { body_(_string); return send_(); }
  inline bool send_json_(const nlohmann::json& _j) // invalid UTF-8 from scripts is replaced, never thrown
  {
    header_json_();
    return send_(_j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  }
  // R5. deferred
  inline void defer_() // handler returns now; the response is finished later with done_() from any thread
  {
    deferred = async;
  }
  inline bool done_(bool _failing = false) // async and deferred only: hand the response to the loop
  {
    if (!async) return false;
    return live_([&](http_g* _gen)
    {
      _gen->is_failing.store(_failing);
      _gen->is_timeout.store(false);
      _gen->completed.store(true);
      uv_async_send(_gen->notify);
    });
  }
  inline bool resume_(int _code, const nlohmann::json& _j) // deferred reply in one call
  {
    if (!status_(_code) || !send_json_(_j)) return false;
    return done_();
  }
};

/* --------------------------------------------- */

class scx_a // app -> ssl_() -> register_()/listen_()/signal_() -> start_()/serve_() -> stop_() -> ~()
{ // async: on_req_() -> pool business_() -> send_() -> done_() -> proceed_() -> ~http_g()
public:
  struct http_h : public h2o_handler_t // handler
  {
    std::string method;
    http_f business_;
    bool async;
    uint64_t timeout_ms;
    scx_a* app;
    static inline int on_req_(h2o_handler_t* _self, h2o_req_t* _req)
    {
      auto* handler = static_cast<http_h*>(_self);
      if (!h2o_memis(_req->method.base, _req->method.len, handler->method.data(), handler->method.size())) return -1; // next handler
      if (!handler->async)
      {
        http_s s{_req, false};
        try
        {
          http_q q{_req};
          handler->business_(q, s);
        }
        catch (const std::exception& e)
        {
          fprintf(stderr, "scx_a.on_req_() [%d]: %.*s %.*s threw: %s\n", getpid(), static_cast<int>(_req->method.len), _req->method.base, static_cast<int>(_req->path.len), _req->path.base, e.what());
          _req->res.status = 500;
          _req->res.reason = "Execute Failure";
          h2o_send_inline(_req, e.what(), strlen(e.what()));
        }
        return 0;
      }
      // 1. generator in the request pool, alive until proceed_() or stop_()
      void* buffer = h2o_mem_alloc_pool(&_req->pool, char, sizeof(http_g));
      if (!buffer)
      {
        fprintf(stderr, "scx_a.on_req_(): Failed to h2o_mem_alloc_pool() for %zu bytes.\n", sizeof(http_g));
        return -1;
      }
      http_g* generator = new(buffer) http_g();
      generator->super.proceed = http_g::proceed_;
      generator->super.stop = http_g::stop_;
      generator->req = _req;
      generator->link = std::make_shared<http_d>();
      generator->link->gen = generator;
      h2o_timer_init(&generator->timer, http_g::on_timeout_);
      if (handler->timeout_ms > 0) h2o_timer_link(_req->conn->ctx->loop, handler->timeout_ms, &generator->timer);
      generator->notify = new uv_async_t;
      uv_async_init(_req->conn->ctx->loop, generator->notify, http_g::on_notify_);
      generator->notify->data = generator;
      h2o_start_response(_req, &generator->super);
      // 2. business on the pool
      handler->app->pthd.fire_(
        [q = http_q{_req}, s = http_s{_req, true, generator->link}, business_ = handler->business_]() mutable
        {
          try
          {
            business_(q, s);
            if (!s.deferred) s.done_();
          }
          catch (const std::exception& e)
          {
            fprintf(stderr, "scx_a.on_req_() [%d]: %.*s %.*s threw: %s\n", getpid(), static_cast<int>(q.method.size()), q.method.data(), static_cast<int>(q.url.size()), q.url.data(), e.what());
            s.done_(true);
          }
        }
      );
      return 0;
    }
    static inline void dispose_(h2o_handler_t* _self)
    {
      auto* handler = static_cast<http_h*>(_self);
      handler->~http_h();
    }
  };
  pth_t pthd;                          // business pool
  std::atomic<uint8_t> state;          // 0 = finalized; 1 = initialized; 2 = serving; 3 = stopped;
  std::thread server_t;                // server thread
  std::atomic<bool> server_a;          // true = thread server alive
  std::atomic<bool> server_r;          // true = server does restart
  std::mutex server_m;
  std::condition_variable server_c;
  uv_loop_t loop;
  uv_async_t loop_a;                   // wakes the loop for stop/close requests
  std::vector<uv_tcp_t*> listeners;
  std::vector<uv_signal_t*> signalers;
  h2o_globalconf_t gconfig;
  h2o_hostconf_t* hconfig = NULL;
  h2o_hostconf_t* hconfig_a[2];
  h2o_context_t ctx;
  h2o_accept_ctx_t accept_ctx;
  SSL_CTX* ssl_ctx = NULL;
  struct prefix_c
  {
    h2o_pathconf_t* pathconf = NULL;
    std::unordered_map<http_m, http_h*> handlers; // <method, handler>
  };
  std::unordered_map<std::string, prefix_c> prefix_groups; // <prefix, prefix_c>
  explicit scx_a(unsigned int _threads = 0) // 0 = two per online cpu
    : pthd(_threads > 0 ? _threads : SCX_MIN2_(4096, SCX_MAX2_(1, sysconf(_SC_NPROCESSORS_ONLN)) * 2))
  {
    state.store(0);
    server_a.store(false);
    server_r.store(false);
    init_();
  }
  ~scx_a() { fina_(); }
  scx_a(const scx_a&) = delete;
  scx_a& operator=(const scx_a&) = delete;
  scx_a(scx_a&&) = delete;
  scx_a& operator=(scx_a&&) = delete;
  inline void init_()
  {
    if (state.load() != 0) return;
    // 1. uv loop with its waker
    int r = uv_loop_init(&loop);
    if (r != 0) throw std::runtime_error(std::string("scx_a.init_(): Failed to uv_loop_init() w/ ") + uv_strerror(r));
    uv_async_init(&loop, &loop_a, [](uv_async_t*) {});
    loop_a.data = this;
    // 2. h2o global and host configuration
    h2o_config_init(&gconfig);
    hconfig = h2o_config_register_host(&gconfig, h2o_iovec_init(H2O_STRLIT("default")), 65535);
    // 3. h2o context and accept context
    h2o_context_init(&ctx, &loop, &gconfig);
    hconfig_a[0] = hconfig;
    hconfig_a[1] = NULL;
    accept_ctx = {};
    accept_ctx.hosts = hconfig_a;
    accept_ctx.ctx = &ctx;
    accept_ctx.ssl_ctx = ssl_ctx;
    state.store(1);
  }
  inline void ssl_(const std::string& _cert_file, const std::string& _key_file) // before serving
  {
    if (state.load() != 1) return;
    if (ssl_ctx)
    {
      SSL_CTX_free(ssl_ctx);
      ssl_ctx = NULL;
    }
    ssl_ctx = SSL_CTX_new(TLS_server_method());
    if (!ssl_ctx)
    {
      throw std::runtime_error("scx_a.ssl_(): Failed to create SSL context w/ " + std::string(ERR_error_string(ERR_get_error(), NULL)));
    }
    if (SSL_CTX_use_certificate_chain_file(ssl_ctx, _cert_file.c_str()) != 1)
    {
      SSL_CTX_free(ssl_ctx);
      ssl_ctx = NULL;
      throw std::runtime_error("scx_a.ssl_(): Failed to load certificate: " + _cert_file + " w/ " + std::string(ERR_error_string(ERR_get_error(), NULL)));
    }
    if (SSL_CTX_use_PrivateKey_file(ssl_ctx, _key_file.c_str(), SSL_FILETYPE_PEM) != 1)
    {
      SSL_CTX_free(ssl_ctx);
      ssl_ctx = NULL;
      throw std::runtime_error("scx_a.ssl_(): Failed to load private key: " + _key_file + " w/ " + std::string(ERR_error_string(ERR_get_error(), NULL)));
    }
    if (SSL_CTX_check_private_key(ssl_ctx) != 1)
    {
      SSL_CTX_free(ssl_ctx);
      ssl_ctx = NULL;
      throw std::runtime_error("scx_a.ssl_(): Private key " + _key_file + " does not match certificate " + _cert_file);
    }
    SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_2_VERSION);
    accept_ctx.ssl_ctx = ssl_ctx;
  }
  inline bool ssl_is_() const noexcept { return ssl_ctx != NULL; }
  static inline void on_accept_(uv_stream_t* _listener, int _status)
  {
    if (_status != 0) return;
    uv_tcp_t* conn = new uv_tcp_t;
    uv_tcp_init(_listener->loop, conn);
    if (uv_accept(_listener, reinterpret_cast<uv_stream_t*>(conn)) != 0)
    {
      uv_close(reinterpret_cast<uv_handle_t*>(conn), [](uv_handle_t* handle) { delete reinterpret_cast<uv_tcp_t*>(handle); });
      return;
    }
    auto* acc_ctx = static_cast<h2o_accept_ctx_t*>(_listener->data);
    h2o_socket_t* sock = h2o_uv_socket_create(reinterpret_cast<uv_handle_t*>(conn)
      , [](uv_handle_t* handle) { delete reinterpret_cast<uv_tcp_t*>(handle); }
    );
    h2o_accept(acc_ctx, sock);
  }
  inline void listen_(const std::string& _host = "0.0.0.0", uint16_t _port = 8080)
  {
    if (state.load() % 2 != 1) return; // finalized or serving
    uv_tcp_t* listener = new uv_tcp_t;
    uv_tcp_init(&loop, listener);
    listener->data = &accept_ctx;
    struct sockaddr_in addr;
    int r = uv_ip4_addr(_host.c_str(), _port, &addr);
    if (r == 0) r = uv_tcp_bind(listener, reinterpret_cast<struct sockaddr*>(&addr), 0);
    if (r == 0) r = uv_listen(reinterpret_cast<uv_stream_t*>(listener), 128, on_accept_);
    if (r != 0)
    {
      uv_close(reinterpret_cast<uv_handle_t*>(listener), [](uv_handle_t* handle) { delete reinterpret_cast<uv_tcp_t*>(handle); });
      throw std::runtime_error("scx_a.listen_(): Failed to listen on " + _host + ":" + std::to_string(_port) + " w/ " + uv_strerror(r));
    }
    listeners.push_back(listener);
  }
  inline void delisten_()
  {
    for (auto* listener : listeners)
    {
      if (uv_is_closing(reinterpret_cast<uv_handle_t*>(listener)) == 0) uv_close(reinterpret_cast<uv_handle_t*>(listener)
        , [](uv_handle_t* handle) { delete reinterpret_cast<uv_tcp_t*>(handle); }
      );
    }
    listeners.clear();
    uv_async_send(&loop_a);
  }
  static inline void on_signal_(uv_signal_t* _sig, int _signum)
  {
    auto* self = static_cast<scx_a*>(_sig->data);
    printf("\nscx_a.signal_() [%d]: Caught signal %d stopping loop ...\n", getpid(), _signum);
    self->stop_();
  }
  inline void signal_()
  {
    if (state.load() % 2 != 1) return;
    for (int signum : {SIGINT, SIGTERM})
    {
      uv_signal_t* signaler = new uv_signal_t;
      if (uv_signal_init(&loop, signaler) != 0)
      {
        delete signaler;
        continue;
      }
      signaler->data = this;
      if (uv_signal_start(signaler, on_signal_, signum) != 0)
      {
        uv_close(reinterpret_cast<uv_handle_t*>(signaler), [](uv_handle_t* handle) { delete reinterpret_cast<uv_signal_t*>(handle); });
        continue;
      }
      signalers.push_back(signaler);
    }
  }
  inline void designal_()
  {
    for (auto* signaler : signalers)
    {
      if (uv_is_closing(reinterpret_cast<uv_handle_t*>(signaler)) == 0) uv_close(reinterpret_cast<uv_handle_t*>(signaler)
        , [](uv_handle_t* handle) { delete reinterpret_cast<uv_signal_t*>(handle); }
      );
    }
    signalers.clear();
    uv_async_send(&loop_a);
  }
  inline void serve_() // loop in the calling thread
  {
    bool is_restart = false;
    uint8_t expected = 1;
    if (!state.compare_exchange_strong(expected, 2)) // initialized -> serving
    {
      expected = 3; // stopped -> serving
      if (!state.compare_exchange_strong(expected, 2))
      {
        if (state.load() != 2) return;
      }
      is_restart = true;
    }
    if (is_restart || server_r.load())
    {
      h2o_context_dispose(&ctx);
      uv_run(&loop, UV_RUN_ONCE);
      h2o_context_init(&ctx, &loop, &gconfig);
      accept_ctx.ctx = &ctx;
      accept_ctx.ssl_ctx = ssl_ctx;
      for (auto* listener : listeners) listener->data = &accept_ctx;
    }
    server_r.store(false);
    {
      std::lock_guard<std::mutex> lock_server(server_m);
      server_a.store(true);
      server_c.notify_all();
    }
    uv_run(&loop, UV_RUN_DEFAULT); // connections -> uv -> h2o -> http_h::on_req_() -> business
    server_a.store(false);
    state.store(3);
  }
  inline void start_() // loop in a server thread; returns once it runs
  {
    server_r.store(false);
    uint8_t expected = 1;
    if (!state.compare_exchange_strong(expected, 1)) // must be initialized
    {
      expected = 3;
      if (!state.compare_exchange_strong(expected, 3)) return;
      server_r.store(true);
    }
    if (server_t.joinable()) server_t.join();
    server_a.store(false);
    server_t = std::thread([this]() { serve_(); });
    std::unique_lock<std::mutex> lock_server(server_m);
    server_c.wait(lock_server, [this]() { return server_a.load() || state.load() == 3; });
  }
  inline void stop_()
  {
    uint8_t expected = 2;
    if (!state.compare_exchange_strong(expected, 3)) return; // serving -> stopped
    delisten_();
    designal_();
    h2o_context_request_shutdown(&ctx);
    uv_stop(&loop);
    uv_async_send(&loop_a);
    server_c.notify_all();
    if (server_t.joinable() && server_t.get_id() != std::this_thread::get_id()) server_t.join();
    server_a.store(false);
  }
  inline void fina_()
  {
    const uint8_t s = state.load();
    if (s == 0) return;
    if (s == 2) stop_();
    if (server_t.joinable() && server_t.get_id() != std::this_thread::get_id()) server_t.join();
    pthd.fina_(); // business tasks may still reference the loop
    delisten_();
    designal_();
    h2o_context_request_shutdown(&ctx);
    h2o_context_dispose(&ctx);
    h2o_config_dispose(&gconfig); // handlers -> pathconf -> hostconf -> globalconf
    uv_close(reinterpret_cast<uv_handle_t*>(&loop_a), NULL);
    uv_run(&loop, UV_RUN_DEFAULT); // drain close callbacks
    int r = uv_loop_close(&loop);
    if (r != 0) fprintf(stderr, "scx_a.fina_() [%d]: uv_loop_close() w/ %s\n", getpid(), uv_strerror(r));
    if (ssl_ctx)
    {
      SSL_CTX_free(ssl_ctx);
      ssl_ctx = NULL;
    }
    prefix_groups.clear();
    h2o_buffer_clear_recycle(1);
    h2o_mem_clear_recycle(&h2o_mem_pool_allocator, 1);
    state.store(0);
  }
  inline void register_(const std::string& _prefix
    , const std::string& _method
    , http_f _business_
    , bool _async = true
    , uint64_t _timeout_ms = 0 // 0 = no timeout; >0 = 504 after timeout ms
    , bool _compress = true
    , size_t _compress_min_size = 100
    , int _compress_gzip_quality = 1
    , int _compress_brotli_quality = 1
  )
  {
    if (state.load() % 2 != 1) return;
    const http_m m(_method);
    auto& pc = prefix_groups[_prefix];
    if (!pc.pathconf)
    {
      pc.pathconf = h2o_config_register_path(hconfig, _prefix.c_str(), 0);
      if (_compress) // first registration decides for the whole prefix
      {
        h2o_compress_args_t compress_args = {};
        compress_args.min_size = _compress_min_size;
        compress_args.gzip.quality = _compress_gzip_quality;
        compress_args.brotli.quality = _compress_brotli_quality;
        h2o_compress_register(pc.pathconf, &compress_args);
      }
    }
    http_h* handler = NULL;
    auto handler_it = pc.handlers.find(m);
    if (handler_it == pc.handlers.end())
    {
      h2o_handler_t* raw_handler = h2o_create_handler(pc.pathconf, sizeof(http_h));
      handler = new(raw_handler) http_h();
      raw_handler->on_req = &http_h::on_req_;
      raw_handler->dispose = &http_h::dispose_;
      pc.handlers[m] = handler;
    }
    else handler = handler_it->second;
    handler->method = _method;
    handler->business_ = std::move(_business_);
    handler->async = _async;
    handler->timeout_ms = _timeout_ms;
    handler->app = this;
  }
  inline void get_(const std::string& _prefix, http_f _business_, bool _async = true, uint64_t _timeout_ms = 0)
  {
    register_(_prefix, "GET", std::move(_business_), _async, _timeout_ms);
  }
  inline void post_(const std::string& _prefix, http_f _business_, bool _async = true, uint64_t _timeout_ms = 0)
  {
    register_(_prefix, "POST", std::move(_business_), _async, _timeout_ms);
  }
};

/* --------------------------------------------- */
