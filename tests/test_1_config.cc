#include "../include/scx_a_config.hh"
#include "../include/scx_a_handler.hh"
#include "../include/scx_a_client.hh"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <zlib.h>
#include <brotli/encode.h>

static short parse_args_(cfg_t& _cfg, std::vector<const char*> _args)
{
  _args.insert(_args.begin(), "scx_a");
  return _cfg.parse_(static_cast<int>(_args.size()), _args.data());
}

static std::string zlib_(const std::string& _in, int _window_bits) // 16 + MAX_WBITS = gzip
{
  z_stream stream = {};
  assert(deflateInit2(&stream, Z_BEST_SPEED, Z_DEFLATED, _window_bits, 8, Z_DEFAULT_STRATEGY) == Z_OK);
  std::string out(deflateBound(&stream, _in.size()) + 32, '\0');
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(_in.data()));
  stream.avail_in = static_cast<uInt>(_in.size());
  stream.next_out = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());
  assert(deflate(&stream, Z_FINISH) == Z_STREAM_END);
  out.resize(stream.total_out);
  deflateEnd(&stream);
  return out;
}

static std::string brotli_(const std::string& _in)
{
  size_t size = BrotliEncoderMaxCompressedSize(_in.size());
  std::string out(size, '\0');
  assert(BrotliEncoderCompress(1, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_TEXT, _in.size()
    , reinterpret_cast<const uint8_t*>(_in.data()), &size, reinterpret_cast<uint8_t*>(out.data())) == BROTLI_TRUE);
  out.resize(size);
  return out;
}

static std::string raw_(const std::string& _headers, const std::string& _body)
{
  return "HTTP/1.1 200 OK\r\n" + _headers + "\r\n" + _body;
}

int main(int argc, char** argv)
{

std::cout << "===========================================================\n" << std::endl;
std::cout << "=== Configuration and Parsing Test Suite ===\n" << std::endl;

std::cout << "=== Test 1: Command Line ===" << std::endl;
{
  cfg_t cfg;
  assert(parse_args_(cfg, {}) == 0);
  assert(cfg.host == "0.0.0.0" && cfg.port == 3001);
  assert(cfg.interpreter == "python3");
  assert(cfg.timeout_ms == 30000 && cfg.output_cap == 10000 && cfg.grace_ms == 5000);
  assert(!cfg.tls_() && !cfg.probe && !cfg.help);
  std::cout << "✓ defaults" << std::endl;

  cfg_t full;
  assert(parse_args_(full, {"--host", "127.0.0.1", "--port=8088", "--interpreter", "python3.11"
    , "--timeout-ms", "1500", "--output-cap=256", "--grace-ms", "0", "--threads", "4"
    , "--cert", "c.pem", "--key", "k.pem", "--probe"}) == 0);
  assert(full.host == "127.0.0.1" && full.port == 8088);
  assert(full.timeout_ms == 1500 && full.output_cap == 256 && full.grace_ms == 0 && full.threads == 4);
  assert(full.tls_() && full.probe);
  exe_c c = full.exe_();
  assert(c.cmd == "python3.11" && c.timeout_ms == 1500 && c.output_cap == 256 && c.grace_ms == 0);
  assert(c.args == std::vector<std::string>{"-c"});
  assert(c.env.at("PYTHONIOENCODING") == "utf-8");
  assert(c.timeout_text_() == "1.5");
  std::cout << "✓ every option, both --name value and --name=value" << std::endl;

  cfg_t help;
  assert(parse_args_(help, {"--help"}) == 0 && help.help);
  assert(std::string(cfg_t::usage_()).find("--timeout-ms") != std::string::npos);
  std::cout << "✓ --help" << std::endl;

  struct bad_t { std::vector<const char*> args; short code; };
  for (const auto& bad : std::vector<bad_t>{
    {{"--port", "0"}, -2},
    {{"--port", "70000"}, -2},
    {{"--port", "80x"}, -2},
    {{"--timeout-ms", "-5"}, -2},
    {{"--output-cap", "0"}, -2},
    {{"--threads", "many"}, -2},
    {{"--interpreter", ""}, -2},
    {{"--cert", "c.pem"}, -2},
    {{"--port"}, -1},
    {{"--verbose", "1"}, -1},
  })
  {
    cfg_t cfg_bad;
    const short r = parse_args_(cfg_bad, bad.args);
    std::cout << "  " << bad.args[0] << " -> " << r << " " << cfg_bad.error << std::endl;
    assert(r == bad.code);
    assert(!cfg_bad.error.empty());
  }
  std::cout << "✓ invalid values rejected with a message" << std::endl;
}

std::cout << "\n=== Test 2: Types ===" << std::endl;
{
  assert(trim_("  a b \r\n\t") == "a b");
  assert(trim_(" \n ").empty());
  assert(trim_("").empty());
  assert(trim_("x") == "x");
  std::cout << "✓ trim_()" << std::endl;

  struct timespec ts = {1760862660, 123456789}; // 2025-10-19T08:31:00
  tim_t t(ts);
  assert(t.utcms == 1760862660123ULL);
  assert(t.iso_() == "2025-10-19T08:31:00.123Z");
  assert(t.to_string_("%Y-%m-%d") == "2025-10-19");
  std::string now = tim_t::now_().iso_();
  assert(now.size() == 24 && now[10] == 'T' && now[19] == '.' && now.back() == 'Z');
  std::cout << "✓ ISO-8601 UTC with milliseconds" << std::endl;

  nlohmann::json h = scx::health_json_();
  assert(h["status"] == "ok");
  assert(h["timestamp"].get<std::string>().size() == 24);
  std::cout << "✓ health body" << std::endl;
}

std::cout << "\n=== Test 3: Execution Request ===" << std::endl;
{
  exe_q q;
  std::string error;
  assert(exe_q::parse_(R"({"script":"print(1)","noteId":"n-7"})", q, error) == 0);
  assert(q.script == "print(1)" && q.note_id == "n-7");
  std::cout << "✓ script and noteId" << std::endl;

  exe_q anon;
  assert(exe_q::parse_(R"({"script":"print(2)"})", anon, error) == 0);
  assert(anon.note_id == "-");
  exe_q numeric;
  assert(exe_q::parse_(R"({"script":"print(3)","noteId":42})", numeric, error) == 0);
  assert(numeric.note_id == "42");
  std::cout << "✓ missing or non-string noteId" << std::endl;

  for (const char* body : {"{", "not json", "{\"script\":\"x\",}"})
  {
    exe_q bad;
    error.clear();
    assert(exe_q::parse_(body, bad, error) == -1);
    assert(error == "Invalid JSON body");
  }
  std::cout << "✓ invalid JSON" << std::endl;

  for (const char* body : {"", " \n", "{}", R"({"script":""})", R"({"script":null})", R"({"script":12})", "[]", R"("print(1)")", R"({"noteId":"n"})"})
  {
    exe_q bad;
    error.clear();
    assert(exe_q::parse_(body, bad, error) == -2);
    assert(error == "Script is required");
  }
  std::cout << "✓ missing, empty or non-string script" << std::endl;
}

std::cout << "\n=== Test 4: Response Decoding ===" << std::endl;
{
  const std::string text = R"({"success":true,"output":")" + std::string(3000, 'z') + R"(","executionTime":12})";

  http_r plain(raw_("Content-Type: application/json\r\nContent-Length: " + std::to_string(text.size()) + "\r\n", text + "trailing"));
  assert(plain.status == 200 && plain.reason == "OK" && plain.vers == "HTTP/1.1");
  assert(plain.body == text);
  assert(plain.header_("content-type") == "application/json");
  assert(plain.json_()["executionTime"] == 12);
  std::cout << "✓ status line, headers, content-length" << std::endl;

  http_r chunked(raw_("Transfer-Encoding: chunked\r\n", "5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\n\r\n"));
  assert(chunked.body == "hello, world");
  std::cout << "✓ chunked" << std::endl;

  http_r gzip(raw_("Content-Encoding: gzip\r\n", zlib_(text, 16 + MAX_WBITS)));
  assert(gzip.body == text);
  http_r deflate(raw_("Content-Encoding: deflate\r\n", zlib_(text, MAX_WBITS)));
  assert(deflate.body == text);
  http_r raw_deflate(raw_("Content-Encoding: deflate\r\n", zlib_(text, -MAX_WBITS)));
  assert(raw_deflate.body == text);
  http_r br(raw_("Content-Encoding: br\r\n", brotli_(text)));
  assert(br.body == text);
  std::cout << "✓ gzip, deflate (zlib and raw), brotli" << std::endl;

  http_r stacked(raw_("Content-Encoding: gzip, br\r\n", brotli_(zlib_(text, 16 + MAX_WBITS))));
  assert(stacked.body == text);
  std::cout << "✓ stacked codings undone in reverse" << std::endl;

  http_r empty("");
  assert(empty.status == 0 && !empty.is_ok_());
  assert(http_r().parse_("garbage\r\n\r\n") == -2);
  std::cout << "✓ malformed responses" << std::endl;
}

std::cout << "\n=== Test 5: Request Copy ===" << std::endl;
{
  std::string method = "POST";
  std::string path = "/execute";
  std::string name = "x-request-id";
  std::string value = "req-9";
  std::string body = R"({"script":"print(1)"})";
  h2o_iovec_t name_iov = h2o_iovec_init(name.data(), name.size());
  h2o_header_t header = {};
  header.name = &name_iov;
  header.value = h2o_iovec_init(value.data(), value.size());
  auto req = std::make_unique<h2o_req_t>();
  req->method = h2o_iovec_init(method.data(), method.size());
  req->path = h2o_iovec_init(path.data(), path.size());
  req->headers.entries = &header;
  req->headers.size = 1;
  req->headers.capacity = 1;
  req->entity = h2o_iovec_init(body.data(), body.size());

  http_q q{req.get()};
  for (std::string* pooled : {&method, &path, &name, &value, &body}) std::fill(pooled->begin(), pooled->end(), '#'); // pool reused after the request ends
  assert(q.method == "POST" && q.url == "/execute");
  assert(q.header_has_("x-request-id") && q.header_("x-request-id") == "req-9");
  assert(q.body == R"({"script":"print(1)"})");
  exe_q parsed;
  std::string error;
  assert(exe_q::parse_(q.body, parsed, error) == 0 && parsed.script == "print(1)");
  std::cout << "✓ request fields outlive the h2o request memory" << std::endl;

  req->entity = h2o_iovec_init(NULL, 0);
  req->headers.size = 0;
  http_q empty{req.get()};
  assert(empty.body.empty() && empty.headers.empty());
  assert(!empty.header_has_("x-request-id") && empty.header_("x-request-id").empty());
  std::cout << "✓ no entity reads as an empty body" << std::endl;
}

std::cout << "\n=== All configuration tests passed ===" << std::endl;
return 0;
}
