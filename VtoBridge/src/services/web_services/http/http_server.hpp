#pragma once

#include <memory>
#include <string>
#include <utility>

#include "mongoose.h"

#include "core/common/logger/logger.hpp"
#include "services/web_services/api/rest_api.hpp"

namespace vtob::services::web_services::http {

// Status API listener. Not thread-safe: Start and Poll belong to the thread
// that runs the main loop, and request handlers run inside Poll.
class MongooseServer {
public:
  struct Options {
    std::string listen_addr = "http://0.0.0.0:8000";
  };

  MongooseServer(Options opt, api::ApiContext ctx,
                 std::shared_ptr<vtob::core::common::log::Logger> logger)
      : opt_(std::move(opt)), ctx_(std::move(ctx)), log_(std::move(logger), "http") {
    mg_mgr_init(&mgr_);
  }

  ~MongooseServer() {
    mg_mgr_free(&mgr_);
  }

  MongooseServer(const MongooseServer&) = delete;
  MongooseServer& operator=(const MongooseServer&) = delete;

  bool Start() {
    if (mg_http_listen(&mgr_, opt_.listen_addr.c_str(), EventHandler, this) == nullptr) {
      log_.Error("failed to listen on " + opt_.listen_addr);
      return false;
    }
    log_.Info("listening on " + opt_.listen_addr);
    return true;
  }

  void Poll(int timeout_ms) {
    mg_mgr_poll(&mgr_, timeout_ms);
  }

private:
  static void EventHandler(struct mg_connection* c, int ev, void* ev_data) {
    auto* self = static_cast<MongooseServer*>(c->fn_data);
    if (self != nullptr) self->HandleEvent(c, ev, ev_data);
  }

  void HandleEvent(struct mg_connection* c, int ev, void* ev_data) {
    if (ev != MG_EV_HTTP_MSG) return;

    auto* hm = static_cast<struct mg_http_message*>(ev_data);
    log_.Debug("request " + std::string(hm->method.buf, hm->method.len) + " " +
               std::string(hm->uri.buf, hm->uri.len));

    if (!api::HandleHttpRequest(c, hm, ctx_)) {
      mg_http_reply(c, 404, "Content-Type: application/json\r\n", "{\"error\":\"not_found\"}\n");
    }
  }

private:
  Options opt_;
  api::ApiContext ctx_;
  vtob::core::common::log::TaggedLogger log_;
  struct mg_mgr mgr_;
};

}  // namespace vtob::services::web_services::http
