#pragma once

#include <cstdlib>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <cctype>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <algorithm>
#include <zlib.h>
#include <brotli/decode.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <nlohmann/json.hpp>

/* --------------------------------------------- */

struct http_r // response received
{
  int status = 0; // 0 = nothing parsed
  std::string reason;
  std::string vers;
  std::unordered_map<std::string, std::vector<std::string>> headers; // lowercased names
  std::string body; // de-chunked and decompressed
  http_r() = default;
  explicit http_r(const std::string& _raw) { parse_(_raw); }
  inline short parse_(const std::string& _raw) // 0 = ok; -1 = no header end; -2 = bad status line
  {
    std::string_view raw(_raw);
    const size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string_view::npos) return -1;
    std::string_view head = raw.substr(0, header_end);
    body = std::string(raw.substr(header_end + 4));
    // 1. "HTTP/1.1 200 OK"
    size_t eol = head.find("\r\n");
    std::string_view line = head.substr(0, eol);
    const size_t sp1 = line.find(' ');
    if (sp1 == std::string_view::npos) return -2;
    vers = std::string(line.substr(0, sp1));
    const size_t sp2 = line.find(' ', sp1 + 1);
    const std::string code(line.substr(sp1 + 1, sp2 == std::string_view::npos ? std::string_view::npos : sp2 - sp1 - 1));
    char* end = NULL;
    const long n = strtol(code.c_str(), &end, 10);
    if (code.empty() || *end != '\0' || n < 100 || n > 999) return -2;
    status = static_cast<int>(n);
    if (sp2 != std::string_view::npos) reason = std::string(line.substr(sp2 + 1));
    // 2. "Name: value" lines
    while (eol != std::string_view::npos)
    {
      const size_t start = eol + 2;
      eol = head.find("\r\n", start);
      line = head.substr(start, eol == std::string_view::npos ? std::string_view::npos : eol - start);
      const size_t colon = line.find(':');
      if (colon == std::string_view::npos) continue;
      std::string name(line.substr(0, colon));
      std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
      std::string_view value = line.substr(colon + 1);
      while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
      while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);
      headers[name].emplace_back(value);
    }
    // 3. body: transfer coding, then content codings last applied first
    if (header_is_("transfer-encoding", "chunked")) body = dechunk_(body);
    else if (header_has_("content-length"))
    {
      const unsigned long long length = strtoull(header_("content-length").c_str(), NULL, 10);
      if (body.size() > length) body.resize(length);
    }
    std::vector<std::string> codings;
    for (const auto& value : header_all_("content-encoding"))
    {
      size_t pos = 0;
      while (pos <= value.size())
      {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        std::string coding = value.substr(pos, comma - pos);
        coding.erase(0, coding.find_first_not_of(" \t"));
        coding.erase(coding.find_last_not_of(" \t") + 1);
        if (!coding.empty()) codings.push_back(coding);
        pos = comma + 1;
      }
    }
    for (auto it = codings.rbegin(); it != codings.rend(); ++it)
    {
      if (*it == "gzip") body = inflate_(body, 16 + MAX_WBITS);
      else if (*it == "deflate") body = inflate_(body, MAX_WBITS);
      else if (*it == "br") body = unbrotli_(body);
    }
    return 0;
  }
  inline bool is_ok_() const { return status >= 200 && status < 300; }
  inline bool header_has_(const std::string& _name) const { return headers.find(_name) != headers.end(); }
  inline std::string header_(const std::string& _name) const // first value
  {
    auto it = headers.find(_name);
    return it != headers.end() && !it->second.empty() ? it->second.front() : std::string();
  }
  inline std::vector<std::string> header_all_(const std::string& _name) const
  {
    auto it = headers.find(_name);
    return it != headers.end() ? it->second : std::vector<std::string>();
  }
  inline bool header_is_(const std::string& _name, std::string_view _token) const // token anywhere in any value
  {
    for (const auto& value : header_all_(_name))
    {
      std::string lower(value);
      std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
      if (lower.find(_token) != std::string::npos) return true;
    }
    return false;
  }
  inline nlohmann::json json_() const // discarded value on failure
  {
    return nlohmann::json::parse(body, nullptr, false);
  }
  static inline std::string dechunk_(const std::string& _chunked)
  {
    std::string out;
    size_t pos = 0;
    while (pos < _chunked.size())
    {
      const size_t eol = _chunked.find("\r\n", pos);
      if (eol == std::string::npos) break;
      char* end = NULL;
      const unsigned long long size = strtoull(_chunked.c_str() + pos, &end, 16); // stops at ";ext" or CR
      if (end == _chunked.c_str() + pos) break;
      pos = eol + 2;
      if (size == 0) break; // trailers ignored
      if (pos + size > _chunked.size()) break;
      out.append(_chunked, pos, size);
      pos += size + 2;
    }
    return out;
  }
  static inline std::string inflate_(const std::string& _in, int _window_bits) // 16 + MAX_WBITS = gzip; MAX_WBITS = zlib
  {
    if (_in.empty()) return _in;
    z_stream stream = {};
    if (inflateInit2(&stream, _window_bits) != Z_OK)
    {
      fprintf(stderr, "http_r.inflate_() [%d]: inflateInit2() failed\n", getpid());
      return _in;
    }
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(_in.data()));
    stream.avail_in = static_cast<uInt>(_in.size());
    std::string out;
    char buffer[32768];
    int r = Z_OK;
    while (r != Z_STREAM_END)
    {
      stream.next_out = reinterpret_cast<Bytef*>(buffer);
      stream.avail_out = sizeof(buffer);
      r = inflate(&stream, Z_NO_FLUSH);
      if (r == Z_DATA_ERROR && _window_bits == MAX_WBITS && out.empty() && stream.total_out == 0)
      { // raw deflate without the zlib wrapper
        inflateEnd(&stream);
        return inflate_(_in, -MAX_WBITS);
      }
      if (r != Z_OK && r != Z_STREAM_END)
      {
        fprintf(stderr, "http_r.inflate_() [%d]: inflate() w/ %d\n", getpid(), r);
        inflateEnd(&stream);
        return _in;
      }
      out.append(buffer, sizeof(buffer) - stream.avail_out);
      if (r == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) break; // truncated stream, keep what we have
    }
    inflateEnd(&stream);
    return out;
  }
  static inline std::string unbrotli_(const std::string& _in)
  {
    if (_in.empty()) return _in;
    BrotliDecoderState* state = BrotliDecoderCreateInstance(NULL, NULL, NULL);
    if (!state)
    {
      fprintf(stderr, "http_r.unbrotli_() [%d]: BrotliDecoderCreateInstance() failed\n", getpid());
      return _in;
    }
    size_t avail_in = _in.size();
    const uint8_t* next_in = reinterpret_cast<const uint8_t*>(_in.data());
    std::string out;
    uint8_t buffer[32768];
    BrotliDecoderResult r = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
    while (r == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT)
    {
      size_t avail_out = sizeof(buffer);
      uint8_t* next_out = buffer;
      r = BrotliDecoderDecompressStream(state, &avail_in, &next_in, &avail_out, &next_out, NULL);
      out.append(reinterpret_cast<char*>(buffer), sizeof(buffer) - avail_out);
    }
    if (r != BROTLI_DECODER_RESULT_SUCCESS)
    {
      fprintf(stderr, "http_r.unbrotli_() [%d]: %s\n", getpid(), r == BROTLI_DECODER_RESULT_ERROR
        ? BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state)) : "truncated stream");
      BrotliDecoderDestroyInstance(state);
      return _in;
    }
    BrotliDecoderDestroyInstance(state);
    return out;
  }
};

/* --------------------------------------------- */

class http_t // blocking HTTP/1.1 client, one connection per request
{
public:
  using headers_t = std::vector<std::pair<std::string, std::string>>;
  // 0 = connected; 1 = timeout; 2 = refused or unreachable; -1 = socket error; -2 = invalid host
  static inline short connect_(const std::string& _host, uint16_t _port, int _timeout_ms, int& _sock)
  {
    _sock = -1;
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_port);
    if (inet_pton(AF_INET, _host.c_str(), &addr.sin_addr) != 1)
    {
      fprintf(stderr, "http_t.connect_() [%d]: Invalid host %s\n", getpid(), _host.c_str());
      return -2;
    }
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0)
    {
      perror("http_t.connect_(): socket()");
      return -1;
    }
    const int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0)
    {
      perror("http_t.connect_(): fcntl()");
      close(sock);
      return -1;
    }
    short status = 0;
    if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
    {
      if (errno != EINPROGRESS) status = 2;
      else if (!wait_(sock, POLLOUT, _timeout_ms)) status = 1;
      else
      {
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0) status = 2;
      }
    }
    if (status != 0)
    {
      close(sock);
      return status;
    }
    _sock = sock; // left non-blocking: all I/O goes through wait_()
    return 0;
  }
  static inline short ping_(const std::string& _host, uint16_t _port, int _timeout_ms = 3000)
  {
    int sock = -1;
    const short status = connect_(_host, _port, _timeout_ms, sock);
    if (sock >= 0) close(sock);
    return status;
  }
  // raw response text, empty on any transport failure
  static inline std::string exchange_(const std::string& _host
    , uint16_t _port
    , const std::string& _method
    , const std::string& _path
    , const std::string& _body = ""
    , const headers_t& _headers = {}
    , int _timeout_ms = 10000
    , bool _use_ssl = false
  )
  {
    int sock = -1;
    if (connect_(_host, _port, _timeout_ms, sock) != 0)
    {
      fprintf(stderr, "http_t.exchange_() [%d]: Failed to connect to %s:%u\n", getpid(), _host.c_str(), _port);
      return std::string();
    }
    SSL_CTX* ssl_ctx = NULL;
    SSL* ssl = NULL;
    std::string response;
    if (_use_ssl && ssl_open_(sock, _timeout_ms, ssl_ctx, ssl) != 0)
    {
      ssl_close_(ssl_ctx, ssl);
      close(sock);
      return response;
    }
    std::string request = _method + " " + _path + " HTTP/1.1\r\n";
    request += "Host: " + _host + ":" + std::to_string(_port) + "\r\n";
    for (const auto& [name, value] : _headers) request += name + ": " + value + "\r\n";
    if (!_body.empty() || _method == "POST") request += "Content-Length: " + std::to_string(_body.size()) + "\r\n";
    request += "Connection: close\r\n\r\n";
    request += _body;
    if (send_(sock, ssl, request, _timeout_ms) == 0) response = recv_(sock, ssl, _timeout_ms);
    else fprintf(stderr, "http_t.exchange_() [%d]: Failed to send %s %s\n", getpid(), _method.c_str(), _path.c_str());
    ssl_close_(ssl_ctx, ssl);
    close(sock);
    return response;
  }
  static inline http_r request_(const std::string& _host
    , uint16_t _port
    , const std::string& _method
    , const std::string& _path
    , const std::string& _body = ""
    , const headers_t& _headers = {}
    , int _timeout_ms = 10000
    , bool _use_ssl = false
  )
  {
    return http_r(exchange_(_host, _port, _method, _path, _body, _headers, _timeout_ms, _use_ssl));
  }
  static inline http_r get_(const std::string& _host, uint16_t _port, const std::string& _path, bool _use_ssl = false)
  {
    return request_(_host, _port, "GET", _path, "", {}, 10000, _use_ssl);
  }
  static inline http_r post_json_(const std::string& _host, uint16_t _port, const std::string& _path
    , const nlohmann::json& _j, int _timeout_ms = 60000, bool _use_ssl = false)
  {
    return request_(_host, _port, "POST", _path, _j.dump(), {{"Content-Type", "application/json"}}, _timeout_ms, _use_ssl);
  }
  // 0 = healthy; 1 = unhealthy answer; 2 = no answer
  static inline short probe_(const std::string& _host, uint16_t _port, bool _use_ssl = false, int _timeout_ms = 3000)
  {
    http_r r = request_(_host, _port, "GET", "/health", "", {}, _timeout_ms, _use_ssl);
    if (r.status == 0) return 2;
    nlohmann::json j = r.json_();
    if (r.status != 200 || !j.is_object() || j.value("status", "") != "ok") return 1;
    return 0;
  }
private:
  static inline bool wait_(int _sock, short _events, int _timeout_ms)
  {
    pollfd pfd = {_sock, _events, 0};
    int r;
    do { r = poll(&pfd, 1, _timeout_ms > 0 ? _timeout_ms : -1); } while (r < 0 && errno == EINTR);
    return r == 1;
  }
  static inline short ssl_open_(int _sock, int _timeout_ms, SSL_CTX*& _ctx, SSL*& _ssl) // self-signed peers accepted
  {
    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx)
    {
      fprintf(stderr, "http_t.ssl_open_() [%d]: SSL_CTX_new() w/ %s\n", getpid(), ERR_error_string(ERR_get_error(), NULL));
      return -1;
    }
    SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, NULL);
    _ssl = SSL_new(_ctx);
    if (!_ssl || SSL_set_fd(_ssl, _sock) != 1) return -1;
    while (true)
    {
      const int r = SSL_connect(_ssl);
      if (r == 1) return 0;
      const int e = SSL_get_error(_ssl, r);
      if (e == SSL_ERROR_WANT_READ && wait_(_sock, POLLIN, _timeout_ms)) continue;
      if (e == SSL_ERROR_WANT_WRITE && wait_(_sock, POLLOUT, _timeout_ms)) continue;
      fprintf(stderr, "http_t.ssl_open_() [%d]: SSL_connect() w/ %d\n", getpid(), e);
      return -2;
    }
  }
  static inline void ssl_close_(SSL_CTX*& _ctx, SSL*& _ssl)
  {
    if (_ssl)
    {
      SSL_shutdown(_ssl);
      SSL_free(_ssl);
      _ssl = NULL;
    }
    if (_ctx)
    {
      SSL_CTX_free(_ctx);
      _ctx = NULL;
    }
  }
  static inline short send_(int _sock, SSL* _ssl, const std::string& _data, int _timeout_ms)
  {
    size_t done = 0;
    while (done < _data.size())
    {
      if (_ssl)
      {
        const int n = SSL_write(_ssl, _data.data() + done, static_cast<int>(_data.size() - done));
        if (n > 0) { done += static_cast<size_t>(n); continue; }
        const int e = SSL_get_error(_ssl, n);
        if (e == SSL_ERROR_WANT_READ && wait_(_sock, POLLIN, _timeout_ms)) continue;
        if (e == SSL_ERROR_WANT_WRITE && wait_(_sock, POLLOUT, _timeout_ms)) continue;
        return -1;
      }
      const ssize_t n = send(_sock, _data.data() + done, _data.size() - done, MSG_NOSIGNAL);
      if (n > 0) { done += static_cast<size_t>(n); continue; }
      if (n < 0 && errno == EINTR) continue;
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) && wait_(_sock, POLLOUT, _timeout_ms)) continue;
      return -1;
    }
    return 0;
  }
  static inline bool complete_(const std::string& _raw) // a full response is in; the server closes anyway
  {
    const size_t header_end = _raw.find("\r\n\r\n");
    if (header_end == std::string::npos) return false;
    http_r head;
    if (head.parse_(_raw.substr(0, header_end + 4)) != 0) return false;
    if (head.header_is_("transfer-encoding", "chunked")) return _raw.find("\r\n0\r\n", header_end) != std::string::npos
      && _raw.compare(_raw.size() - 4, 4, "\r\n\r\n") == 0;
    if (head.header_has_("content-length")) return _raw.size() - header_end - 4 >= strtoull(head.header_("content-length").c_str(), NULL, 10);
    return false;
  }
  static inline std::string recv_(int _sock, SSL* _ssl, int _timeout_ms)
  {
    std::string raw;
    char buffer[16384];
    while (!complete_(raw))
    {
      if (_ssl)
      {
        const int n = SSL_read(_ssl, buffer, sizeof(buffer));
        if (n > 0) { raw.append(buffer, static_cast<size_t>(n)); continue; }
        const int e = SSL_get_error(_ssl, n);
        if (e == SSL_ERROR_WANT_READ && wait_(_sock, POLLIN, _timeout_ms)) continue;
        if (e == SSL_ERROR_WANT_WRITE && wait_(_sock, POLLOUT, _timeout_ms)) continue;
        break; // closed or failed
      }
      const ssize_t n = recv(_sock, buffer, sizeof(buffer), 0);
      if (n > 0) { raw.append(buffer, static_cast<size_t>(n)); continue; }
      if (n == 0) break;
      if (errno == EINTR) continue;
      if ((errno == EAGAIN || errno == EWOULDBLOCK) && wait_(_sock, POLLIN, _timeout_ms)) continue;
      break;
    }
    return raw;
  }
};

/* --------------------------------------------- */
