#pragma once

#include "message.hpp"

#include "parley/utils.hpp"

namespace parley::rpc {

/**
 * @brief How a call finished.
 *
 * `code()` is clear on success. A server-reported error has `code()` equal to
 * `ecode::protocol_error`, and carries the server's code, message and data.
 */
class Status {
private:
  std::error_code code_{};
  int64_t server_code_{0};
  string message_{};
  nlohmann::json data_{};

public:
  Status() = default;

  Status(std::error_code code, string message = "")
      : code_{code}, message_{message.empty() && code ? code.message() : std::move(message)} {}

  Status(ecode code, string message = "") : Status{make_error_code(code), std::move(message)} {}

  static Status from_server(ErrorObject error) {
    Status status{ecode::protocol_error, std::move(error.message)};
    status.server_code_ = error.code;
    status.data_ = std::move(error.data);
    return status;
  }

  std::error_code code() const { return code_; }
  int64_t server_code() const { return server_code_; }
  std::string_view message() const { return message_; }
  const nlohmann::json& data() const { return data_; }
  bool ok() const { return !code_; }

  bool operator==(const Status& o) const {
    return (code_ == o.code_) && (server_code_ == o.server_code_) && (message_ == o.message_) &&
           (data_ == o.data_);
  }
  bool operator!=(const Status& o) const { return !(*this == o); }
};

} // namespace parley::rpc
