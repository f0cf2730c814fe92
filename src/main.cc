/**
 * main.cc: script execution server
 *
 * Run:   ./scx_a [--port 3001] [--interpreter python3] [--timeout-ms 30000]
 * Test:  curl -X POST -H 'Content-Type: application/json' \
 *          -d '{"script":"print(1+1)","noteId":"n1"}' http://localhost:3001/execute
 */

#include "../include/scx_a_server.hh"
#include "../include/scx_a_handler.hh"
#include "../include/scx_a_config.hh"
#include "../include/scx_a_client.hh"

int main(int argc, char** argv)
{
  cfg_t cfg;
  if (cfg.parse_(argc, argv) != 0)
  {
    fprintf(stderr, "scx_a: %s\n%s", cfg.error.c_str(), cfg_t::usage_());
    return 2;
  }
  if (cfg.help)
  {
    printf("%s", cfg_t::usage_());
    return 0;
  }
  if (cfg.probe) // for container health checks
  {
    const std::string host = cfg.host == "0.0.0.0" ? "127.0.0.1" : cfg.host;
    const short r = http_t::probe_(host, cfg.port, cfg.tls_());
    printf("scx_a: probe %s:%u %s\n", host.c_str(), cfg.port, r == 0 ? "ok" : (r == 1 ? "unhealthy" : "unreachable"));
    return r;
  }

  try
  {
    exe_t engine(cfg.exe_()); // outlives the server: late results find their requests gone
    scx_a app(cfg.threads);
    if (cfg.tls_()) app.ssl_(cfg.cert, cfg.key);
    scx::mount_(app, engine);
    app.listen_(cfg.host, cfg.port);
    app.signal_();

    const char* scheme = app.ssl_is_() ? "https" : "http";
    std::cout << "scx_a listening on " << scheme << "://" << cfg.host << ":" << cfg.port << std::endl;
    std::cout << "  interpreter: " << cfg.interpreter << " -c <script>" << std::endl;
    std::cout << "  deadline:    " << cfg.timeout_ms << " ms (grace " << cfg.grace_ms << " ms)" << std::endl;
    std::cout << "  output cap:  " << cfg.output_cap << " characters per stream" << std::endl;
    std::cout << "  workers:     " << app.pthd.size_() << std::endl;
    std::cout << "Endpoints:" << std::endl;
    std::cout << "  POST /execute   (/api/execute)" << std::endl;
    std::cout << "  GET  /health    (/api/health)" << std::endl;
    std::cout << "Press Ctrl+C to stop." << std::endl;

    app.serve_(); // blocks until SIGINT or SIGTERM

    std::cout << "scx_a stopped, " << engine.live_() << " script(s) still running are cancelled." << std::endl;
  }
  catch (const std::exception& e)
  {
    fprintf(stderr, "scx_a [%d]: %s\n", getpid(), e.what());
    return 1;
  }
  return 0;
}
