#pragma once

#include <cstdio>
#include <unistd.h>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "scx_a_types.hh"
#include "scx_a_process_exec.hh"
#include "scx_a_server.hh"

/* --------------------------------------------- */

struct exe_q // execution request
{
  std::string script;
  std::string note_id = "-"; // log correlation only
  // 0 = ok; -1 = body is not JSON; -2 = script missing, empty or not a string
  static inline short parse_(std::string_view _body, exe_q& _q, std::string& _error)
  {
    if (trim_(_body).empty()) _body = "{}"; // no body reads as an empty object
    nlohmann::json j = nlohmann::json::parse(_body.begin(), _body.end(), nullptr, false);
    if (j.is_discarded())
    {
      _error = "Invalid JSON body";
      return -1;
    }
    if (!j.is_object() || !j.contains("script") || !j["script"].is_string() || j["script"].get_ref<const std::string&>().empty())
    {
      _error = "Script is required";
      return -2;
    }
    _q.script = j["script"].get<std::string>();
    if (j.contains("noteId") && !j["noteId"].is_null())
    {
      const auto& note = j["noteId"];
      _q.note_id = note.is_string() ? note.get<std::string>() : note.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return 0;
  }
};

/* --------------------------------------------- */

namespace scx
{
  inline void ok_(http_s& _s, const nlohmann::json& _data)
  {
    _s.status_(200);
    _s.send_json_(_data);
  }

  inline void bad_request_(http_s& _s, const std::string& _msg = "Bad Request")
  {
    _s.status_(400);
    _s.send_json_({{"success", false}, {"error", _msg}});
  }

  inline nlohmann::json health_json_()
  {
    return {{"status", "ok"}, {"timestamp", tim_t::now_().iso_()}};
  }

  inline void health_(const http_q&, http_s& _s) { ok_(_s, health_json_()); }

  inline void execute_(exe_t& _engine, const http_q& _q, http_s& _s)
  {
    exe_q request;
    std::string error;
    if (exe_q::parse_(_q.body, request, error) != 0)
    {
      bad_request_(_s, error);
      return;
    }
    if (request.note_id == "-" && _q.header_has_("x-request-id")) request.note_id = _q.header_("x-request-id");
    printf("scx.execute_() [%d]: Executing script for note: %s\n", getpid(), request.note_id.c_str());
    _s.defer_();
    _engine.launch_(std::move(request.script), [s = _s, note_id = request.note_id](exe_r&& _r) mutable
    {
      printf("scx.execute_() [%d]: Execution complete: %s in %lums (note: %s)\n", getpid()
        , _r.success ? "success" : "failed", static_cast<unsigned long>(_r.elapsed_ms), note_id.c_str());
      if (!s.resume_(200, _r.to_json_()))
      {
        fprintf(stderr, "scx.execute_() [%d]: note %s result dropped, request is gone\n", getpid(), note_id.c_str());
      }
    });
  }

  // POST /execute, POST /api/execute, GET /health, GET /api/health
  inline void mount_(scx_a& _app, exe_t& _engine)
  {
    for (const char* prefix : {"/execute", "/api/execute"})
    {
      _app.post_(prefix, [&_engine](const http_q& _q, http_s& _s) { execute_(_engine, _q, _s); }, true);
    }
    for (const char* prefix : {"/health", "/api/health"})
    {
      _app.get_(prefix, health_, false);
    }
  }
}

/* --------------------------------------------- */
