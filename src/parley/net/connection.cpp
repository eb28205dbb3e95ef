#include "connection.hpp"

namespace parley::net {

Connection::Connection(TransportFactory transport_factory)
    : transport_factory_{std::move(transport_factory)} {}

Connection::~Connection() { release_transport_(); }

void Connection::set_state_(ConnectionState state) {
  TRACE("connection {}: {} -> {}", endpoint_.to_string(), str(this->state()), str(state));
  state_.store(state, std::memory_order_release);
}

void Connection::release_transport_() {
  transport_.reset();
  events_.reset();
}

// -------------------------------------------------------------------------------------------- open

error_code Connection::open(const Endpoint& endpoint, const EventsFactory& make_events) {
  if (state() != ConnectionState::DISCONNECTED)
    return {};

  endpoint_ = endpoint;
  const auto generation = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;

  try {
    events_ = make_events(generation);
    transport_ = transport_factory_ ? transport_factory_(*events_) : nullptr;
  } catch (std::exception& e) {
    LOG_ERR("failed to create transport for {}: {}", endpoint_.to_string(), e.what());
    release_transport_();
    return make_error_code(ecode::connect_failure);
  }

  if (transport_ == nullptr) {
    LOG_ERR("no transport available for {}", endpoint_.to_string());
    release_transport_();
    return make_error_code(ecode::connect_failure);
  }

  set_state_(ConnectionState::CONNECTING);
  transport_->open(endpoint_);
  return {};
}

// ------------------------------------------------------------------------------------------- close

bool Connection::close(uint16_t close_code, std::string_view reason) {
  const auto current = state();
  if (current != ConnectionState::CONNECTED && current != ConnectionState::CONNECTING)
    return false;

  set_state_(ConnectionState::CLOSING);
  transport_->close(close_code, reason);
  return true;
}

// ------------------------------------------------------------------------------------- handle_open

bool Connection::handle_open() {
  if (state() != ConnectionState::CONNECTING)
    return false;
  set_state_(ConnectionState::CONNECTED);
  return true;
}

// ----------------------------------------------------------------------------------- handle_closed

ConnectionState Connection::handle_closed() {
  const auto previous = state();
  if (previous != ConnectionState::DISCONNECTED) {
    set_state_(ConnectionState::DISCONNECTED);
    release_transport_();
  }
  return previous;
}

// -------------------------------------------------------------------------------------------- send

error_code Connection::send(BufferType&& buffer) {
  if (state() != ConnectionState::CONNECTED)
    return make_error_code(ecode::not_connected);
  transport_->send_message(std::move(buffer));
  return {};
}

} // namespace parley::net
