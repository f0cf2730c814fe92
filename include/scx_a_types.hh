#pragma once

#include <cstdlib>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <string>
#include <string_view>

/* --------------------------------------------- */

#ifndef SCX_MAX2_
#define SCX_MAX2_(a, b) ((a) > (b) ? (a) : (b))
#endif
#ifndef SCX_MIN2_
#define SCX_MIN2_(a, b) ((a) < (b) ? (a) : (b))
#endif

/* --------------------------------------------- */

struct tim_t
{
  time_t   utcs;  // seconds since epoch (UTC)
  int64_t  nsec;  // nanoseconds (0 <= nsec < 1e9)
  uint64_t utcms; // milliseconds since epoch

  tim_t() : utcs(0), nsec(0), utcms(0) {}

  explicit tim_t(const struct timespec& _ts)
  {
    utcs = _ts.tv_sec;
    nsec = _ts.tv_nsec;
    utcms = static_cast<uint64_t>(_ts.tv_sec) * 1000 + _ts.tv_nsec / 1000000;
  }

  static inline tim_t now_()
  {
    tim_t t;
    struct timespec ts;
    if (clock_gettime(CLOCK_REALTIME, &ts) == 0) t = tim_t(ts);
    else
    {
      t.utcs = time(NULL);
      t.utcms = static_cast<uint64_t>(t.utcs) * 1000;
    }
    return t;
  }

  inline std::string to_string_(const char* format = "%Y-%m-%d %H:%M:%S") const
  {
    char buffer[64];
    struct tm t;
    gmtime_r(&utcs, &t);
    size_t len = strftime(buffer, sizeof(buffer), format, &t);
    if (len > 0) return std::string(buffer, len);
    return std::string();
  }

  inline std::string iso_() const // 2026-10-19T08:31:00.123Z
  {
    std::string s = to_string_("%Y-%m-%dT%H:%M:%S");
    if (s.empty()) return s;
    char ms[8];
    snprintf(ms, sizeof(ms), ".%03dZ", static_cast<int>(nsec / 1000000));
    return s + ms;
  }
};

/* --------------------------------------------- */

struct dat_t
{
  void* p;   // pointer
  size_t b;  // bytes

  dat_t(size_t bytes = 0) : p(NULL), b(bytes) {}
  dat_t(void* position, size_t bytes) : p(position), b(bytes) {}
};

/* --------------------------------------------- */

inline std::string_view trim_(std::string_view _s) noexcept // strip ASCII whitespace at both ends
{
  constexpr std::string_view ws = " \t\n\v\f\r";
  size_t start = _s.find_first_not_of(ws);
  if (start == std::string_view::npos) return std::string_view();
  size_t end = _s.find_last_not_of(ws);
  return _s.substr(start, end - start + 1);
}

/* --------------------------------------------- */
