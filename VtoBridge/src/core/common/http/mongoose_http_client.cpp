#include "core/common/http/http_client.hpp"

#include <cstdint>
#include <string>

#include "mongoose.h"

namespace vtob::core::common::http {

namespace {

struct Exchange {
  const std::string* url = nullptr;
  const std::string* body = nullptr;
  const std::string* content_type = nullptr;
  HttpResponse* response = nullptr;
  bool done = false;
};

void EventHandler(struct mg_connection* c, int ev, void* ev_data) {
  auto* x = static_cast<Exchange*>(c->fn_data);
  if (x == nullptr) return;

  if (ev == MG_EV_CONNECT) {
    const struct mg_str host = mg_url_host(x->url->c_str());
    if (mg_url_is_ssl(x->url->c_str())) {
      struct mg_tls_opts opts {};
      opts.name = host;
      mg_tls_init(c, &opts);
    }
    mg_printf(c,
              "POST %s HTTP/1.0\r\n"
              "Host: %.*s\r\n"
              "Content-Type: %s\r\n"
              "Accept: application/json\r\n"
              "Content-Length: %lu\r\n"
              "\r\n",
              mg_url_uri(x->url->c_str()), static_cast<int>(host.len), host.buf,
              x->content_type->c_str(), static_cast<unsigned long>(x->body->size()));
    mg_send(c, x->body->data(), x->body->size());
  } else if (ev == MG_EV_HTTP_MSG) {
    const auto* hm = static_cast<struct mg_http_message*>(ev_data);
    x->response->ok = true;
    x->response->status = mg_http_status(const_cast<struct mg_http_message*>(hm));
    x->response->body.assign(hm->body.buf, hm->body.len);
    x->done = true;
    c->is_draining = 1;
  } else if (ev == MG_EV_ERROR) {
    const char* err = static_cast<const char*>(ev_data);
    x->response->error = err != nullptr ? err : "unknown error";
    x->done = true;
  } else if (ev == MG_EV_CLOSE) {
    if (!x->done) {
      x->response->error = "connection closed before response";
      x->done = true;
    }
    c->fn_data = nullptr;
  }
}

}  // namespace

HttpResponse MongooseHttpClient::Post(const std::string& url, const std::string& body,
                                      const std::string& content_type, int timeout_ms) {
  HttpResponse response;
  Exchange x;
  x.url = &url;
  x.body = &body;
  x.content_type = &content_type;
  x.response = &response;

  struct mg_mgr mgr;
  mg_mgr_init(&mgr);

  if (mg_http_connect(&mgr, url.c_str(), EventHandler, &x) == nullptr) {
    response.error = "cannot connect to " + url;
    mg_mgr_free(&mgr);
    return response;
  }

  const std::uint64_t deadline = mg_millis() + static_cast<std::uint64_t>(timeout_ms > 0 ? timeout_ms : 0);
  while (!x.done && mg_millis() < deadline) mg_mgr_poll(&mgr, 50);

  if (!x.done) {
    response.ok = false;
    response.error = "timeout after " + std::to_string(timeout_ms) + " ms";
    x.done = true;
  }

  // Connections still open get MG_EV_CLOSE here; x outlives the manager.
  mg_mgr_free(&mgr);
  return response;
}

}  // namespace vtob::core::common::http
