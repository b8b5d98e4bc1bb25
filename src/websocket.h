#ifndef WEBSOCKET_H_
#define WEBSOCKET_H_

#include <atomic>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/common/thread.hpp>

// Connection to the platform's judge cable.
// Commands arrive wrapped in the cable envelope {"identifier", "message"};
// welcome, ping and subscription confirmations only refresh the ping clock.
class ChannelClient {
 public:
  using PlainEndpoint = websocketpp::client<websocketpp::config::asio_client>;
  using SecureEndpoint = websocketpp::client<websocketpp::config::asio_tls_client>;
  using Handle = websocketpp::connection_hdl;
  using SSLContext = boost::asio::ssl::context;

  static constexpr int kReconnectSeconds = 3;

 private:
  std::variant<PlainEndpoint, SecureEndpoint> endpoint_;
  std::shared_ptr<websocketpp::lib::thread> io_thread_;

  std::string url_, key_;
  Handle conn_;
  std::atomic_bool open_, closing_;
  std::atomic<double> last_seen_;

  template <class Endpoint> void Setup_(Endpoint& ep) {
    using namespace websocketpp::lib;
    ep.clear_access_channels(websocketpp::log::alevel::all);
    ep.clear_error_channels(websocketpp::log::elevel::all);
    ep.init_asio();
    ep.start_perpetual();
    if constexpr (std::is_same<SecureEndpoint, Endpoint>::value) {
      ep.set_tls_init_handler(bind(&ChannelClient::MakeSSLContext_, placeholders::_1));
    }
    io_thread_ = std::make_shared<thread>(&Endpoint::run, &ep);
  }

  template <class Endpoint> void Teardown_(Endpoint& ep) {
    ep.stop_perpetual();
    if (open_) {
      websocketpp::lib::error_code ec;
      ep.close(conn_, websocketpp::close::status::going_away, "shutdown", ec);
    }
  }

  template <class Endpoint> bool Dial_(Endpoint& ep) {
    using namespace websocketpp::lib;
    error_code ec;
    auto conn = ep.get_connection(url_, ec);
    if (ec) return false;
    conn->append_header("Authorization", "Bearer " + key_);
    conn->set_open_handler(bind(&ChannelClient::Opened_, this, placeholders::_1));
    conn->set_fail_handler(bind(&ChannelClient::Dropped_, this, placeholders::_1));
    conn->set_close_handler(bind(&ChannelClient::Dropped_, this, placeholders::_1));
    conn->set_message_handler([this](Handle, typename Endpoint::message_ptr msg) {
      Received_(msg->get_payload());
    });
    ep.connect(conn);
    return true;
  }

  template <class Endpoint> bool Write_(Endpoint& ep, const std::string& str) {
    websocketpp::lib::error_code ec;
    ep.send(conn_, str, websocketpp::frame::opcode::text, ec);
    return !ec;
  }

  template <class Endpoint> bool Hangup_(Endpoint& ep) {
    websocketpp::lib::error_code ec;
    ep.close(conn_, websocketpp::close::status::going_away, "ping timeout", ec);
    if (!ec) closing_ = true;
    return !ec;
  }

  static std::shared_ptr<SSLContext> MakeSSLContext_(Handle);
  void Opened_(Handle);
  void Dropped_(Handle);
  void Received_(const std::string&);
  bool Write(const std::string&);

 public:
  // platform_url is the http(s) base URL of the platform
  ChannelClient(const std::string& platform_url, const std::string& key);
  virtual ~ChannelClient();

  const std::string& Url() const { return url_; }
  bool IsSecure() const { return endpoint_.index() == 1; }
  bool CanSend() const { return open_ && !closing_; }
  // no frame from the platform for longer than timeout seconds
  bool Stale(double timeout) const;

  // called from the io thread; must not block
  virtual void OnFrame() {}
  virtual void OnSubscribed() {}
  virtual void OnDisconnected() {}
  virtual void OnCommand(nlohmann::json&&) {}

  bool Connect();
  // reconnect after kReconnectSeconds on a detached thread
  void ScheduleReconnect();
  bool Perform(const std::string& action, const nlohmann::json& body);
  bool Close();
};

std::string CableUrl(const std::string& platform_url);
double MonotonicSeconds();

#endif // WEBSOCKET_H_
