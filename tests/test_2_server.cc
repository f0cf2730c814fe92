#include "../include/scx_a_server.hh"
#include "../include/scx_a_handler.hh"
#include "../include/scx_a_client.hh"

#include <cassert>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

static const std::string HOST = "127.0.0.1";

static http_r execute_(uint16_t _port, const nlohmann::json& _body, const std::string& _path = "/execute")
{
  return http_t::post_json_(HOST, _port, _path, _body);
}

static http_r execute_raw_(uint16_t _port, const std::string& _body)
{
  return http_t::request_(HOST, _port, "POST", "/execute", _body, {{"Content-Type", "application/json"}});
}

static bool self_signed_(const std::string& _cert_file, const std::string& _key_file) // localhost, one day
{
  EVP_PKEY* pkey = EVP_RSA_gen(2048);
  if (!pkey) return false;
  X509* x509 = X509_new();
  X509_set_version(x509, 2);
  ASN1_INTEGER_set(X509_get_serialNumber(x509), 1);
  X509_gmtime_adj(X509_getm_notBefore(x509), 0);
  X509_gmtime_adj(X509_getm_notAfter(x509), 86400);
  X509_set_pubkey(x509, pkey);
  X509_NAME* name = X509_get_subject_name(x509);
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
  X509_set_issuer_name(x509, name);
  bool ok = X509_sign(x509, pkey, EVP_sha256()) > 0;
  FILE* f = ok ? fopen(_cert_file.c_str(), "w") : NULL;
  ok = f && PEM_write_X509(f, x509) == 1;
  if (f) fclose(f);
  f = ok ? fopen(_key_file.c_str(), "w") : NULL;
  ok = f && PEM_write_PrivateKey(f, pkey, NULL, NULL, 0, NULL, NULL) == 1;
  if (f) fclose(f);
  X509_free(x509);
  EVP_PKEY_free(pkey);
  return ok;
}

int main(int argc, char** argv)
{

std::cout << "===========================================================\n" << std::endl;
std::cout << "=== HTTP Execution Service Test Suite ===\n" << std::endl;

const uint16_t port = 18501;
exe_t engine(exe_c("python3", 1500, EXE_OUTPUT_CAP, 500));
scx_a app(2);
scx::mount_(app, engine);
app.listen_(HOST, port);
app.start_();
assert(http_t::ping_(HOST, port) == 0);

std::cout << "=== Test 1: Health ===" << std::endl;
{
  for (const char* path : {"/health", "/api/health"})
  {
    http_r r = http_t::get_(HOST, port, path);
    std::cout << path << " -> " << r.status << " " << r.body << std::endl;
    assert(r.status == 200);
    assert(r.header_("content-type").find("application/json") == 0);
    nlohmann::json j = r.json_();
    assert(j["status"] == "ok");
    const std::string ts = j["timestamp"].get<std::string>();
    assert(ts.size() == 24 && ts[10] == 'T' && ts.back() == 'Z');
  }
  std::cout << "✓ GET /health and /api/health" << std::endl;

  assert(http_t::probe_(HOST, port) == 0);
  std::cout << "✓ probe_()" << std::endl;
}

std::cout << "\n=== Test 2: Validation ===" << std::endl;
{
  http_r r = execute_raw_(port, "{not json");
  assert(r.status == 400);
  assert(r.json_() == nlohmann::json({{"success", false}, {"error", "Invalid JSON body"}}));
  std::cout << "✓ invalid JSON -> 400" << std::endl;

  for (const nlohmann::json& body : {nlohmann::json::object(), nlohmann::json({{"script", ""}, {"noteId", "n1"}})
    , nlohmann::json({{"script", 5}}), nlohmann::json({{"noteId", "n2"}})})
  {
    r = execute_(port, body);
    std::cout << body << " -> " << r.status << " " << r.body << std::endl;
    assert(r.status == 400);
    assert(r.json_() == nlohmann::json({{"success", false}, {"error", "Script is required"}}));
  }
  assert(engine.live_() == 0);
  std::cout << "✓ missing, empty or non-string script -> 400, nothing spawned" << std::endl;

  r = http_t::get_(HOST, port, "/execute");
  assert(r.status == 404);
  r = http_t::get_(HOST, port, "/nowhere");
  assert(r.status == 404);
  std::cout << "✓ unknown method or path -> 404" << std::endl;
}

std::cout << "\n=== Test 3: Execution ===" << std::endl;
{
  http_r r = execute_(port, {{"script", "print('hello from python')"}, {"noteId", "note-1"}});
  std::cout << "Response: " << r.body << std::endl;
  assert(r.status == 200);
  nlohmann::json j = r.json_();
  assert(j["success"] == true);
  assert(j["output"] == "hello from python");
  assert(!j.contains("error"));
  assert(j["executionTime"].is_number_unsigned());
  std::cout << "✓ POST /execute success" << std::endl;

  r = execute_(port, {{"script", "x = 2"}, {"noteId", "note-2"}}, "/api/execute");
  assert(r.status == 200);
  assert(r.json_()["output"] == "(no output)");
  std::cout << "✓ POST /api/execute, placeholder output" << std::endl;

  r = execute_(port, {{"script", "import sys\nsys.exit(4)"}});
  assert(r.status == 200);
  j = r.json_();
  assert(j["success"] == false);
  assert(j["error"] == "Process exited with code 4");
  assert(!j.contains("output"));
  std::cout << "✓ nonzero exit rendered with 200" << std::endl;

  r = execute_(port, {{"script", "print(undefined_name)"}});
  j = r.json_();
  assert(r.status == 200 && j["success"] == false);
  assert(j["error"].get<std::string>().find("NameError") != std::string::npos);
  std::cout << "✓ stderr rendered as error" << std::endl;

  auto t0 = std::chrono::steady_clock::now();
  r = execute_(port, {{"script", "import time\ntime.sleep(10)"}, {"noteId", "slow"}});
  auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  j = r.json_();
  std::cout << "Response: " << r.body << " in " << took << "ms" << std::endl;
  assert(r.status == 200);
  assert(j["success"] == false);
  assert(j["error"] == "Execution timed out after 1.5 seconds");
  assert(j["executionTime"].get<uint64_t>() >= 1400);
  assert(took < 5000);
  std::cout << "✓ deadline rendered with 200" << std::endl;

  r = execute_(port, {{"script", "print('x' * 12000)"}});
  j = r.json_();
  assert(j["success"] == true);
  assert(j["output"].get<std::string>().size() == 10023);
  std::cout << "✓ capped output over HTTP" << std::endl;

  r = execute_(port, {{"script", "import sys\nsys.stdout.buffer.write(b'\\xff\\xfe ok')"}});
  assert(r.status == 200);
  j = r.json_();
  assert(!j.is_discarded());
  assert(j["output"].get<std::string>().find("ok") != std::string::npos);
  std::cout << "✓ invalid UTF-8 from a script still yields valid JSON" << std::endl;

  r = http_t::request_(HOST, port, "POST", "/execute", R"({"script":"print(7)"})"
    , {{"Content-Type", "application/json"}, {"X-Request-Id", "req-99"}});
  assert(r.status == 200 && r.json_()["output"] == "7");
  std::cout << "✓ X-Request-Id accepted as correlation id" << std::endl;
}

std::cout << "\n=== Test 4: Compression ===" << std::endl;
{
  const std::string script = "print('abc' * 2000)";
  std::string expected;
  for (int i = 0; i < 2000; ++i) expected += "abc";
  for (const char* coding : {"gzip", "br"})
  {
    http_r r = http_t::request_(HOST, port, "POST", "/execute", nlohmann::json({{"script", script}}).dump()
      , {{"Content-Type", "application/json"}, {"Accept-Encoding", coding}});
    assert(r.status == 200);
    nlohmann::json j = r.json_();
    assert(j["output"] == expected);
    if (r.header_is_("content-encoding", coding)) std::cout << "✓ " << coding << " response decoded" << std::endl;
    else std::cout << "✓ " << coding << " not applied by the server, body intact" << std::endl;
  }
}

std::cout << "\n=== Test 5: Concurrency ===" << std::endl;
{
  const int n = 12; // more than the handler pool: responses are deferred, not blocking workers
  std::vector<std::thread> clients;
  std::vector<nlohmann::json> results(n);
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < n; ++i)
  {
    clients.emplace_back([i, &results, port]()
    {
      http_r r = execute_(port, {{"script", "import time\ntime.sleep(1)\nprint('client-" + std::to_string(i) + "')"}, {"noteId", "c" + std::to_string(i)}});
      results[i] = r.json_();
    });
  }
  for (auto& t : clients) t.join();
  auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  std::cout << n << " one-second scripts over HTTP in " << took << "ms with " << app.pthd.size_() << " workers" << std::endl;
  for (int i = 0; i < n; ++i)
  {
    assert(results[i]["success"] == true);
    assert(results[i]["output"] == "client-" + std::to_string(i));
  }
  assert(took < 6000);
  std::cout << "✓ concurrent requests isolated and not serialized" << std::endl;
}

std::cout << "\n=== Test 6: Client Gone ===" << std::endl;
{
  http_r r = http_t::request_(HOST, port, "POST", "/execute", R"({"script":"import time\ntime.sleep(1)\nprint(1)","noteId":"gone"})"
    , {{"Content-Type", "application/json"}}, 300);
  assert(r.status == 0);
  std::this_thread::sleep_for(std::chrono::milliseconds(2500));
  assert(engine.live_() == 0);
  r = http_t::get_(HOST, port, "/health");
  assert(r.status == 200);
  r = execute_(port, {{"script", "print('still serving')"}});
  assert(r.json_()["output"] == "still serving");
  std::cout << "✓ result for a vanished client dropped, server unaffected" << std::endl;

  std::vector<std::thread> leavers;
  for (int i = 0; i < 24; ++i)
  {
    leavers.emplace_back([port, i]()
    { // leaves before, during or right after the script finishes
      http_t::request_(HOST, port, "POST", "/execute", R"({"script":"print(1)","noteId":"racing"})"
        , {{"Content-Type", "application/json"}}, 1 + (i % 8) * 10);
    });
  }
  for (auto& t : leavers) t.join();
  auto until = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (engine.live_() > 0 && std::chrono::steady_clock::now() < until) std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(engine.live_() == 0);
  r = execute_(port, {{"script", "print('after the leavers')"}});
  assert(r.status == 200 && r.json_()["output"] == "after the leavers");
  std::cout << "✓ clients leaving as their scripts finish or while queued" << std::endl;
}

app.stop_();

std::cout << "\n=== Test 7: TLS ===" << std::endl;
{
  const std::string cert = "/tmp/scx_a_test_cert.pem";
  const std::string key = "/tmp/scx_a_test_key.pem";
  assert(self_signed_(cert, key));
  const uint16_t tls_port = 18502;
  scx_a tls_app(2);
  tls_app.ssl_(cert, key);
  assert(tls_app.ssl_is_());
  scx::mount_(tls_app, engine);
  tls_app.listen_(HOST, tls_port);
  tls_app.start_();
  http_r r = http_t::get_(HOST, tls_port, "/health", true);
  assert(r.status == 200 && r.json_()["status"] == "ok");
  r = http_t::post_json_(HOST, tls_port, "/execute", {{"script", "print('over tls')"}}, 10000, true);
  assert(r.status == 200 && r.json_()["output"] == "over tls");
  assert(http_t::probe_(HOST, tls_port, true) == 0);
  std::cout << "✓ HTTPS health and execute" << std::endl;

  bool threw = false;
  scx_a bad_app(1);
  try { bad_app.ssl_("/tmp/scx_a_missing_cert.pem", key); }
  catch (const std::runtime_error& e)
  {
    threw = true;
    std::cout << "Expected: " << e.what() << std::endl;
  }
  assert(threw && !bad_app.ssl_is_());
  std::cout << "✓ missing certificate throws" << std::endl;
  tls_app.stop_();
  remove(cert.c_str());
  remove(key.c_str());
}

std::cout << "\n=== Test 8: Listen Failure ===" << std::endl;
{
  scx_a first(1);
  first.listen_(HOST, 18503);
  scx_a second(1);
  bool threw = false;
  try { second.listen_(HOST, 18503); }
  catch (const std::runtime_error& e)
  {
    threw = true;
    std::cout << "Expected: " << e.what() << std::endl;
  }
  assert(threw);
  std::cout << "✓ port in use throws" << std::endl;
}

std::cout << "\n=== All server tests passed ===" << std::endl;
return 0;
}
