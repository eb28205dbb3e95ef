#include "room-api.hpp"

namespace parley::room {

using rpc::Params;

RoomApi::RoomApi(boost::asio::io_context& io_context, rpc::RpcClient::Config config,
                 net::TransportFactory transport_factory, RoomListener& listener)
    : listener_{listener}
    , client_{io_context, std::move(config), std::move(transport_factory), *this} {}

// ------------------------------------------------------------------------------------ Room methods

void RoomApi::send_join_room(std::string_view user, std::string_view room, int64_t id) {
  client_.send("joinRoom", Params{{"user", string{user}}, {"room", string{room}}}, id);
}

void RoomApi::send_leave_room(int64_t id) { client_.send("leaveRoom", {}, id); }

void RoomApi::send_publish_video(std::string_view sdp_offer, bool do_loopback, int64_t id) {
  client_.send("publishVideo",
               Params{{"sdpOffer", string{sdp_offer}}, {"doLoopback", do_loopback}}, id);
}

void RoomApi::send_unpublish_video(int64_t id) { client_.send("unpublishVideo", {}, id); }

void RoomApi::send_receive_video_from(std::string_view sender, std::string_view sdp_offer,
                                      int64_t id) {
  client_.send("receiveVideoFrom",
               Params{{"sdpOffer", string{sdp_offer}}, {"sender", string{sender}}}, id);
}

void RoomApi::send_unsubscribe_from_video(std::string_view user, std::string_view stream,
                                          int64_t id) {
  client_.send("unsubscribeFromVideo", Params{{"sender", format("{}_{}", user, stream)}}, id);
}

void RoomApi::send_on_ice_candidate(std::string_view endpoint_name, std::string_view candidate,
                                    std::string_view sdp_mid, int64_t sdp_mline_index) {
  // onIceCandidate with an integer sdpMLineIndex, not receiveVideoFrom with a string index
  client_.send("onIceCandidate",
               Params{{"endpointName", string{endpoint_name}},
                      {"candidate", string{candidate}},
                      {"sdpMid", string{sdp_mid}},
                      {"sdpMLineIndex", sdp_mline_index}},
               rpc::k_no_reply);
}

void RoomApi::send_message(std::string_view room, std::string_view user,
                           std::string_view message, int64_t id) {
  client_.send("sendMessage",
               Params{{"message", string{message}},
                      {"userMessage", string{user}},
                      {"roomMessage", string{room}}},
               id);
}

error_code RoomApi::send_custom_request(const vector<string>& names,
                                        const vector<string>& values, int64_t id) {
  if (names.size() != values.size()) {
    WARN("customRequest not sent: {} names, but {} values", names.size(), values.size());
    return make_error_code(ecode::argument_error);
  }

  Params params;
  for (std::size_t i = 0; i < names.size(); ++i)
    params.insert_or_assign(names[i], values[i]);
  client_.send("customRequest", std::move(params), id);
  return {};
}

// ---------------------------------------------------------------------------------------- RpcSink

void RoomApi::on_open() { listener_.on_room_connected(); }

void RoomApi::on_response(int64_t id, const rpc::Status& status, const nlohmann::json& result) {
  if (status.ok())
    listener_.on_room_response(RoomResponse{id, result});
  else
    listener_.on_room_error(RoomError::from_status(id, status));
}

void RoomApi::on_notification(std::string_view method, const nlohmann::json& params) {
  listener_.on_room_notification(RoomNotification{string{method}, params});
}

void RoomApi::on_request(int64_t id, std::string_view method, const nlohmann::json& params) {
  WARN("room server called '{}' (id={}), which is not supported", method, id);
  client_.respond_error(id, rpc::ErrorObject{rpc::k_method_not_found,
                                             format("method '{}' not found", method), {}});
}

void RoomApi::on_connection_closed(uint16_t code, std::string_view reason, bool remote) {
  listener_.on_room_disconnected(code, reason, remote);
}

void RoomApi::on_error(std::error_code ec, std::string_view detail) {
  WARN("room connection: {}: {}", ec.message(), detail);
}

} // namespace parley::room
