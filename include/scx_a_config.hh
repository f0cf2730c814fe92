#pragma once

#include <cstdlib>
#include <cstdio>
#include <cerrno>
#include <climits>
#include <string>
#include <string_view>
#include "scx_a_process_exec.hh"

/* --------------------------------------------- */

struct cfg_t // command line
{
  std::string host = "0.0.0.0";
  uint16_t port = 3001;
  std::string interpreter = "python3";
  uint64_t timeout_ms = EXE_TIMEOUT_MS;
  size_t output_cap = EXE_OUTPUT_CAP;
  uint64_t grace_ms = EXE_GRACE_MS;
  unsigned int threads = 0; // 0 = two per online cpu
  std::string cert;
  std::string key;
  bool probe = false; // GET /health against host:port and exit
  bool help = false;
  std::string error; // last parse failure

  inline exe_c exe_() const
  {
    exe_c c(interpreter, timeout_ms, output_cap, grace_ms);
    return c;
  }
  inline bool tls_() const { return !cert.empty() && !key.empty(); }

  static inline const char* usage_()
  {
    return
      "usage: scx_a [options]\n"
      "  --host <addr>         listen address (default 0.0.0.0)\n"
      "  --port <n>            listen port (default 3001)\n"
      "  --interpreter <cmd>   interpreter run as <cmd> -c <script> (default python3)\n"
      "  --timeout-ms <n>      deadline per script, 0 = none (default 30000)\n"
      "  --output-cap <n>      characters kept per output stream (default 10000)\n"
      "  --grace-ms <n>        SIGTERM to SIGKILL interval, 0 = never (default 5000)\n"
      "  --threads <n>         handler pool size, 0 = two per cpu (default 0)\n"
      "  --cert <file>         TLS certificate chain (PEM), needs --key\n"
      "  --key <file>          TLS private key (PEM), needs --cert\n"
      "  --probe               check GET /health on --host:--port and exit\n"
      "  --help                this text\n";
  }

  // 0 = ok; -1 = unknown option or missing value; -2 = invalid value
  inline short parse_(int _argc, const char* const* _argv)
  {
    error.clear();
    for (int i = 1; i < _argc; ++i)
    {
      std::string_view arg(_argv[i]);
      std::string value;
      if (arg == "--help" || arg == "-h") { help = true; continue; }
      if (arg == "--probe") { probe = true; continue; }
      const size_t eq = arg.find('=');
      std::string_view name = arg.substr(0, eq);
      if (eq != std::string_view::npos) value = std::string(arg.substr(eq + 1));
      else if (i + 1 < _argc) value = _argv[++i];
      else
      {
        error = "missing value for " + std::string(arg);
        return -1;
      }
      uint64_t n = 0;
      if (name == "--host") host = value;
      else if (name == "--interpreter") interpreter = value;
      else if (name == "--cert") cert = value;
      else if (name == "--key") key = value;
      else if (name == "--port")
      {
        if (number_(value, n) != 0 || n == 0 || n > 65535) return invalid_(name, value);
        port = static_cast<uint16_t>(n);
      }
      else if (name == "--timeout-ms")
      {
        if (number_(value, n) != 0) return invalid_(name, value);
        timeout_ms = n;
      }
      else if (name == "--output-cap")
      {
        if (number_(value, n) != 0 || n == 0) return invalid_(name, value);
        output_cap = static_cast<size_t>(n);
      }
      else if (name == "--grace-ms")
      {
        if (number_(value, n) != 0) return invalid_(name, value);
        grace_ms = n;
      }
      else if (name == "--threads")
      {
        if (number_(value, n) != 0 || n > 4096) return invalid_(name, value);
        threads = static_cast<unsigned int>(n);
      }
      else
      {
        error = "unknown option " + std::string(name);
        return -1;
      }
    }
    if (interpreter.empty()) return invalid_("--interpreter", interpreter);
    if (cert.empty() != key.empty())
    {
      error = "--cert and --key go together";
      return -2;
    }
    return 0;
  }

private:
  static inline short number_(const std::string& _s, uint64_t& _n)
  {
    if (_s.empty() || _s[0] < '0' || _s[0] > '9') return -1;
    errno = 0;
    char* end = NULL;
    unsigned long long v = strtoull(_s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return -1;
    _n = static_cast<uint64_t>(v);
    return 0;
  }
  inline short invalid_(std::string_view _name, const std::string& _value)
  {
    error = "invalid value for " + std::string(_name) + ": '" + _value + "'";
    return -2;
  }
};

/* --------------------------------------------- */
