#pragma once

#include <memory>
#include <string>

#include "core/cloud/status_pushback.hpp"
#include "core/common/http/http_client.hpp"
#include "core/common/logger/logger.hpp"

namespace vtob::services::cloud_services {

// Pushes device state through the bemfa cloud "postJsonMsg" endpoint.
class BemfaPushback final : public vtob::core::cloud::StatusPushback {
public:
  struct Options {
    std::string url = "https://apis.bemfa.com/va/postJsonMsg";
    int timeout_ms = 30000;
  };

  BemfaPushback(Options opt, std::shared_ptr<vtob::core::common::http::HttpClient> http,
                std::shared_ptr<vtob::core::common::log::Logger> logger);

  vtob::core::cloud::PushResult SendStatus(const std::string& account_key, const std::string& topic,
                                           const std::string& status,
                                           const std::string& human_message) override;

  // {uid, topic, type: 1, msg[, wemsg]}
  static std::string BuildBody(const std::string& account_key, const std::string& topic,
                               const std::string& status, const std::string& human_message);

  // {code, message} from a reply body; code -1 when unreadable.
  static vtob::core::cloud::PushResult ParseReply(const std::string& body);

private:
  Options opt_;
  std::shared_ptr<vtob::core::common::http::HttpClient> http_;
  vtob::core::common::log::TaggedLogger log_;
};

}  // namespace vtob::services::cloud_services
