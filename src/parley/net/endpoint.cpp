#include "endpoint.hpp"

#include <charconv>

namespace parley::net {

string Endpoint::to_string() const {
  return format("{}://{}:{}{}", (secure ? "wss" : "ws"), host, port, path);
}

expected<Endpoint, error_code> parse_endpoint(string_view url) {
  constexpr string_view k_ws = "ws://";
  constexpr string_view k_wss = "wss://";

  const auto bad_url = [url]() {
    TRACE("rejecting url '{}'", url);
    return make_unexpected(make_error_code(ecode::argument_error));
  };

  Endpoint out;
  string_view rest;
  if (url.starts_with(k_wss)) {
    out.secure = true;
    rest = url.substr(k_wss.size());
  } else if (url.starts_with(k_ws)) {
    out.secure = false;
    rest = url.substr(k_ws.size());
  } else {
    return bad_url();
  }

  // Split host[:port] from the path
  const auto slash = rest.find('/');
  const auto hostport = rest.substr(0, slash);
  out.path = (slash == string_view::npos) ? string{"/"} : string{rest.substr(slash)};

  const auto colon = hostport.find(':');
  out.host = string{hostport.substr(0, colon)};
  if (out.host.empty())
    return bad_url();

  if (colon == string_view::npos) {
    out.port = out.secure ? 443 : 80;
  } else {
    const auto port_str = hostport.substr(colon + 1);
    unsigned long port = 0;
    const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (port_str.empty() || ec != std::errc{} || ptr != port_str.data() + port_str.size() ||
        port == 0 || port > 65535)
      return bad_url();
    out.port = static_cast<uint16_t>(port);
  }

  return out;
}

} // namespace parley::net
