#include "websocket.h"

#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

namespace {

const std::string kChannelIdentifier = "{\"channel\":\"JudgeChannel\"}";

} // namespace

double MonotonicSeconds() {
  auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration<double>(dur).count();
}

std::string CableUrl(const std::string& platform_url) {
  std::string base = platform_url;
  while (base.size() && base.back() == '/') base.pop_back();
  if (base.compare(0, 8, "https://") == 0) {
    base = "wss://" + base.substr(8);
  } else if (base.compare(0, 7, "http://") == 0) {
    base = "ws://" + base.substr(7);
  }
  return base + "/judge/cable";
}

ChannelClient::ChannelClient(const std::string& platform_url, const std::string& key) :
    url_(CableUrl(platform_url)), key_(key), open_(false), closing_(false), last_seen_(0) {
  if (url_.compare(0, 6, "wss://") == 0) endpoint_.emplace<SecureEndpoint>();
  std::visit([this](auto& ep) { Setup_(ep); }, endpoint_);
}

ChannelClient::~ChannelClient() {
  std::visit([this](auto& ep) { Teardown_(ep); }, endpoint_);
  io_thread_->join();
}

std::shared_ptr<ChannelClient::SSLContext> ChannelClient::MakeSSLContext_(Handle) {
  using namespace boost::asio::ssl;
  auto ctx = std::make_shared<context>(context::tls_client);
  ctx->set_options(context::default_workarounds | context::no_sslv2 | context::no_sslv3 |
                   context::single_dh_use);
  ctx->set_default_verify_paths();
  return ctx;
}

void ChannelClient::Opened_(Handle hdl) {
  conn_ = hdl;
  open_ = true;
  last_seen_ = MonotonicSeconds();
  nlohmann::json sub{{"identifier", kChannelIdentifier}, {"command", "subscribe"}};
  if (!Write(sub.dump())) spdlog::warn("Failed to subscribe to judge channel");
}

void ChannelClient::Dropped_(Handle) {
  conn_ = Handle();
  open_ = false;
  closing_ = false;
  last_seen_ = 0;
  OnDisconnected();
}

void ChannelClient::Received_(const std::string& payload) {
  using nlohmann::json;
  json data;
  try {
    data = json::parse(payload);
  } catch (const json::exception& err) {
    spdlog::warn("Undecodable frame from platform: {}", err.what());
    return;
  }
  last_seen_ = MonotonicSeconds();
  spdlog::debug("Frame from platform: {}", payload);
  OnFrame();
  if (data.is_object() && data.contains("type")) {
    if (data["type"] == "confirm_subscription") OnSubscribed();
    return;
  }
  if (!data.is_object() || !data.contains("message") || !data["message"].is_object()) return;
  OnCommand(std::move(data["message"]));
}

bool ChannelClient::Write(const std::string& str) {
  bool ret = std::visit([&](auto& ep) { return Write_(ep, str); }, endpoint_);
  spdlog::debug("Frame to platform: {}, result={}", str, ret);
  return ret;
}

bool ChannelClient::Stale(double timeout) const {
  double seen = last_seen_;
  return seen > 0 && MonotonicSeconds() - seen > timeout;
}

bool ChannelClient::Connect() {
  return std::visit([this](auto& ep) { return Dial_(ep); }, endpoint_);
}

void ChannelClient::ScheduleReconnect() {
  std::thread([this]() {
    std::this_thread::sleep_for(std::chrono::seconds(kReconnectSeconds));
    if (!Connect()) spdlog::warn("Invalid judge channel URL {}", url_);
  }).detach();
}

bool ChannelClient::Perform(const std::string& action, const nlohmann::json& body) {
  using nlohmann::json;
  json data(body);
  data["action"] = action;
  json frame{
    {"identifier", kChannelIdentifier},
    {"command", "message"},
    {"data", data.dump(-1, ' ', false, json::error_handler_t::ignore)},
  };
  return Write(frame.dump());
}

bool ChannelClient::Close() {
  return std::visit([this](auto& ep) { return Hangup_(ep); }, endpoint_);
}
