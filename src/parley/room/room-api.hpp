#pragma once

#include "room-listener.hpp"

#include "parley/rpc/rpc-client.hpp"
#include "parley/utils.hpp"

namespace parley::room {

// ----------------------------------------------------------------------------------------- RoomApi

/**
 * @brief The room server protocol: join and leave rooms, publish and subscribe to
 *        media, exchange ICE candidates and chat messages.
 *
 * Each `send_` method takes the call id that the matching `RoomResponse` or
 * `RoomError` will carry. Methods may be called from any thread.
 */
class RoomApi final : private rpc::RpcSink {
private:
  RoomListener& listener_;
  rpc::RpcClient client_;

  void on_open() override;
  void on_response(int64_t id, const rpc::Status& status, const nlohmann::json& result) override;
  void on_notification(std::string_view method, const nlohmann::json& params) override;
  void on_request(int64_t id, std::string_view method, const nlohmann::json& params) override;
  void on_connection_closed(uint16_t code, std::string_view reason, bool remote) override;
  void on_error(std::error_code ec, std::string_view detail) override;

public:
  /**
   * Exceptions
   * + std::runtime_error if `config.url` is not a ws:// or wss:// url
   */
  RoomApi(boost::asio::io_context& io_context, rpc::RpcClient::Config config,
          net::TransportFactory transport_factory, RoomListener& listener);

  void connect_websocket() { client_.connect(); }
  void disconnect_websocket() { client_.disconnect(); }
  bool is_websocket_connected() const noexcept { return client_.is_connected(); }

  void send_join_room(std::string_view user, std::string_view room, int64_t id);
  void send_leave_room(int64_t id);
  void send_publish_video(std::string_view sdp_offer, bool do_loopback, int64_t id);
  void send_unpublish_video(int64_t id);
  void send_receive_video_from(std::string_view sender, std::string_view sdp_offer, int64_t id);

  /**
   * @brief Stop receiving `stream` of `user`, i.e., sender "<user>_<stream>".
   */
  void send_unsubscribe_from_video(std::string_view user, std::string_view stream, int64_t id);

  /**
   * @brief Trickle an ICE candidate; the server does not reply.
   */
  void send_on_ice_candidate(std::string_view endpoint_name, std::string_view candidate,
                             std::string_view sdp_mid, int64_t sdp_mline_index);

  void send_message(std::string_view room, std::string_view user, std::string_view message,
                    int64_t id);

  /**
   * @brief Send a "customRequest" with the parameters names[i] = values[i].
   * @return `ecode::argument_error` (and nothing is sent) if the lists differ in length.
   */
  error_code send_custom_request(const vector<string>& names, const vector<string>& values,
                                 int64_t id);
};

} // namespace parley::room
