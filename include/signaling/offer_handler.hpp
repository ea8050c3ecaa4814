#pragma once

#include "core/error.hpp"
#include "logging/logger.hpp"
#include "signaling/signaling_exchange.hpp"
#include "signaling/wire.hpp"
#include "transport/peer_connection.hpp"
#include <boost/beast/http.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace signaling {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

inline constexpr std::string_view kOfferPath = "/offer";

// OfferHandler
// Answering side of the signaling protocol for a single POST /offer:
//   parse offer -> new PeerConnection -> apply offer -> create data channel
//   -> answer (gathering complete) -> adopt -> 200 {"type":"answer",...}
// Threading model:
// - Handle() blocks for the duration of candidate gathering, so it runs on
//   the signaling worker pool, never on the reactor
// - Any failure after the PeerConnection exists closes it before the error
//   response is produced
class OfferHandler {
public:
  // Receives ownership of a negotiated connection and its (not yet open)
  // sending channel.
  using AdoptFn =
      std::function<void(std::shared_ptr<transport::PeerConnection>,
                         std::shared_ptr<transport::DataChannel>)>;

  struct Settings {
    std::string label = "fileStream";
    std::chrono::milliseconds gather_timeout{10000};
  };

  OfferHandler(transport::PeerConnectionFactory &factory, AdoptFn adopt,
               Settings settings, logging::Logger &log)
      : factory_(factory), adopt_(std::move(adopt)),
        settings_(std::move(settings)), log_(log) {}

  Response Handle(const Request &req, std::stop_token st = {}) {
    const std::string_view target(req.target().data(), req.target().size());
    if (target != kOfferPath) {
      return Text(req, http::status::not_found, "Not found");
    }
    if (req.method() != http::verb::post) {
      auto res = Text(req, http::status::method_not_allowed,
                      "Method not allowed");
      res.set(http::field::allow, "POST");
      return res;
    }

    auto offer = wire::DecodeDescription(req.body());
    if (!offer) {
      log_.Error(kComponent, "Failed to parse offer: ", offer.error().message);
      return Text(req, http::status::bad_request,
                  "Failed to parse offer: " + offer.error().message);
    }
    if (offer->type != core::SdpType::offer) {
      log_.Error(kComponent, "Rejected description of type ",
                 core::ToString(offer->type));
      return Text(req, http::status::bad_request,
                  std::string("Failed to parse offer: expected an offer, got ") +
                      core::ToString(offer->type));
    }

    auto created = factory_.Create();
    if (!created) {
      return Fail(req, "create peer connection", created.error());
    }
    std::shared_ptr<transport::PeerConnection> pc = std::move(*created);
    CloseOnExit guard{pc};

    SignalingExchange exchange(*pc, log_, settings_.gather_timeout);
    if (auto s = exchange.ApplyRemoteDescription(*offer); !s) {
      return Fail(req, "set remote description", s.error());
    }
    auto channel = pc->CreateDataChannel(settings_.label);
    if (!channel) {
      return Fail(req, "create data channel", channel.error());
    }
    auto answer = exchange.CreateLocalDescription(core::SdpType::answer, st);
    if (!answer) {
      return Fail(req, "create answer", answer.error());
    }

    guard.Release();
    adopt_(pc, *channel);
    log_.Info(kComponent, "Answer ready for ", req[http::field::host]);

    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = wire::EncodeDescription(*answer);
    res.prepare_payload();
    return res;
  }

  // Plain-text response helper shared with the listener's own error paths.
  static Response Text(const Request &req, http::status status,
                       std::string body) {
    Response res{status, req.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body) + "\n";
    res.prepare_payload();
    return res;
  }

private:
  static constexpr std::string_view kComponent = "signaling";

  struct CloseOnExit {
    std::shared_ptr<transport::PeerConnection> pc;
    ~CloseOnExit() {
      if (pc) {
        pc->Close();
      }
    }
    void Release() { pc.reset(); }
  };

  Response Fail(const Request &req, const char *step, const core::Error &e) {
    log_.Error(kComponent, "Failed to ", step, ": ", core::Describe(e));
    return Text(req, http::status::internal_server_error,
                std::string("Failed to ") + step + ": " + e.message);
  }

  transport::PeerConnectionFactory &factory_;
  AdoptFn adopt_;
  Settings settings_;
  logging::Logger &log_;
};

} // namespace signaling
