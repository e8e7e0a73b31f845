/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>

#include "common/logger.hpp"
#include "transport/transport.hpp"

namespace ferry::transport {
  using boost::asio::io_context;

  struct SocketChannelConfig {
    std::string host{"127.0.0.1"};
    std::string port{"8090"};
    std::string target{"/content"};
    /** Largest accepted reply message */
    uint64_t max_message_size{64 << 20};
  };

  enum class SocketReplyStatus : uint8_t {
    kOk = 0,
    kNotFound = 1,
  };

  /**
   * Transport over a websocket to the content server.
   * One binary request message with the content id, one binary reply with
   * status byte and body. Connection is closed after the reply.
   */
  class SocketChannelTransport : public Transport {
   public:
    SocketChannelTransport(io_context &io, SocketChannelConfig config);

    TransportName name() const override;

    void attempt(AttemptRequest request, AttemptCallback cb) override;

    const SocketChannelConfig &config() const {
      return config_;
    }

   private:
    io_context &io_;
    SocketChannelConfig config_;

    common::Logger logger_;
  };

}  // namespace ferry::transport
