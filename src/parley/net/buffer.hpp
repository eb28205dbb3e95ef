#pragma once

#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

namespace parley::net {

using BufferType = std::vector<std::byte>;

inline std::span<const std::byte> to_span_bytes(const BufferType& buffer) {
  return {buffer.data(), buffer.data() + buffer.size()};
}

inline std::string_view to_string_view(std::span<const std::byte> payload) {
  return {reinterpret_cast<const char*>(payload.data()), payload.size()};
}

inline BufferType make_send_buffer(std::string_view ss) {
  const std::byte* data = reinterpret_cast<const std::byte*>(ss.data());
  return BufferType{data, data + ss.size()};
}

inline BufferType make_send_buffer(std::span<const std::byte> ss) {
  return BufferType{ss.begin(), ss.end()};
}

inline BufferType& operator<<(BufferType& buffer, std::string_view ss) {
  const auto offset = buffer.size();
  buffer.resize(offset + ss.size());
  if (!ss.empty())
    std::memcpy(&buffer[offset], ss.data(), ss.size());
  return buffer;
}

} // namespace parley::net
