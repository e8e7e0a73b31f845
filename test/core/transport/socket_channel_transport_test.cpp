/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/impl/socket_channel_transport.hpp"

#include <future>
#include <map>
#include <thread>

#include <gtest/gtest.h>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "common/io_thread.hpp"

namespace ferry::transport {
  namespace beast = boost::beast;
  namespace websocket = beast::websocket;
  namespace net = boost::asio;
  using tcp = net::ip::tcp;

  /// Websocket content server answering a single request
  class ContentServer {
   public:
    explicit ContentServer(std::map<Bytes, Bytes> content)
        : content_{std::move(content)},
          acceptor_{io_, {net::ip::make_address("127.0.0.1"), 0}},
          thread_{[this] { serve(); }} {}
    ~ContentServer() {
      thread_.join();
    }

    std::string port() const {
      return std::to_string(acceptor_.local_endpoint().port());
    }

    std::string target() const {
      std::lock_guard lock{mutex_};
      return target_;
    }

   private:
    void serve() {
      try {
        tcp::socket socket{io_};
        acceptor_.accept(socket);
        websocket::stream<tcp::socket> ws{std::move(socket)};
        beast::http::request<beast::http::empty_body> upgrade;
        beast::flat_buffer upgrade_buffer;
        beast::http::read(ws.next_layer(), upgrade_buffer, upgrade);
        {
          std::lock_guard lock{mutex_};
          target_ = std::string{upgrade.target()};
        }
        ws.accept(upgrade);

        beast::flat_buffer buffer;
        ws.read(buffer);
        const auto *begin{static_cast<const uint8_t *>(buffer.cdata().data())};
        Bytes key{begin, begin + buffer.size()};
        Bytes reply;
        auto it{content_.find(key)};
        if (it == content_.end()) {
          reply.push_back(static_cast<uint8_t>(SocketReplyStatus::kNotFound));
        } else {
          reply.push_back(static_cast<uint8_t>(SocketReplyStatus::kOk));
          reply.insert(reply.end(), it->second.begin(), it->second.end());
        }
        ws.binary(true);
        ws.write(net::buffer(reply));

        // wait for the client close frame
        beast::flat_buffer rest;
        ws.read(rest);
      } catch (const beast::system_error &) {
        // closed by the client
      }
    }

    std::map<Bytes, Bytes> content_;
    net::io_context io_;
    tcp::acceptor acceptor_;
    mutable std::mutex mutex_;
    std::string target_;
    std::thread thread_;
  };

  class SocketChannelTransportTest : public ::testing::Test {
   public:
    AttemptOutcome attempt(SocketChannelTransport &transport, Bytes key) {
      auto content{std::make_shared<content::ContentRequest>()};
      content->content_id = content::ContentId{std::move(key)};
      AttemptRequest request;
      request.session_id = 1;
      request.content = content;
      request.timeout = std::chrono::seconds{5};
      request.cancel = std::make_shared<CancelToken>();
      request.on_progress = [this](uint64_t bytes, uint64_t) {
        progress = bytes;
      };

      std::promise<AttemptOutcome> promise;
      auto future{promise.get_future()};
      transport.attempt(request, [&](AttemptOutcome outcome) {
        promise.set_value(std::move(outcome));
      });
      EXPECT_EQ(future.wait_for(std::chrono::seconds{5}),
                std::future_status::ready);
      return future.get();
    }

    SocketChannelConfig config(const std::string &port) const {
      SocketChannelConfig config;
      config.port = port;
      config.target = "/files";
      return config;
    }

    IoThread io_thread;
    uint64_t progress{};
  };

  /**
   * @given server holding the content
   * @when attempt runs
   * @then body is delivered over the configured target
   */
  TEST_F(SocketChannelTransportTest, Delivers) {
    std::map<Bytes, Bytes> content;
    content.emplace(Bytes{0xab}, Bytes{1, 2, 3, 4});
    ContentServer server{std::move(content)};
    SocketChannelTransport transport{*io_thread.io, config(server.port())};
    auto outcome{attempt(transport, Bytes{0xab})};

    auto &delivered{boost::get<Delivered>(outcome)};
    EXPECT_EQ(boost::get<Bytes>(delivered.data), (Bytes{1, 2, 3, 4}));
    EXPECT_EQ(delivered.bytes, 4);
    EXPECT_EQ(progress, 4);
    EXPECT_EQ(server.target(), "/files");
  }

  /**
   * @given server without the content
   * @when attempt runs
   * @then transport is unavailable
   */
  TEST_F(SocketChannelTransportTest, NotFound) {
    ContentServer server{std::map<Bytes, Bytes>{}};
    SocketChannelTransport transport{*io_thread.io, config(server.port())};
    auto outcome{attempt(transport, Bytes{0xcd})};
    EXPECT_NO_THROW(boost::get<Unavailable>(outcome));
  }

  /**
   * @given nobody listening on the port
   * @when attempt runs
   * @then transport is unavailable
   */
  TEST_F(SocketChannelTransportTest, ConnectionRefused) {
    std::string port;
    {
      net::io_context io;
      tcp::acceptor acceptor{io, {net::ip::make_address("127.0.0.1"), 0}};
      port = std::to_string(acceptor.local_endpoint().port());
    }
    SocketChannelTransport transport{*io_thread.io, config(port)};
    auto outcome{attempt(transport, Bytes{0xab})};
    EXPECT_NO_THROW(boost::get<Unavailable>(outcome));
  }

}  // namespace ferry::transport
