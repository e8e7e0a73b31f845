/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/impl/socket_channel_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "transport/attempt_once.hpp"

namespace ferry::transport {
  namespace beast = boost::beast;
  namespace websocket = beast::websocket;
  namespace net = boost::asio;
  using tcp = net::ip::tcp;

  namespace {
    struct ChannelSession : std::enable_shared_from_this<ChannelSession> {
      ChannelSession(io_context &io,
                     const SocketChannelConfig &config,
                     AttemptRequest request,
                     AttemptCallback cb)
          : strand{net::make_strand(io)},
            resolver{strand},
            ws{strand},
            config{config},
            request{std::move(request)},
            done{std::move(cb)} {}
      ChannelSession(const ChannelSession &) = delete;
      ChannelSession(ChannelSession &&) = delete;
      ~ChannelSession() {
        boost::system::error_code ec;
        beast::get_lowest_layer(ws).socket().shutdown(
            tcp::socket::shutdown_both, ec);
      }
      ChannelSession &operator=(const ChannelSession &) = delete;
      ChannelSession &operator=(ChannelSession &&) = delete;

      void run() {
        if (request.timeout.count() > 0) {
          beast::get_lowest_layer(ws).expires_after(request.timeout);
        }
        resolver.async_resolve(
            config.host,
            config.port,
            [self{shared_from_this()}](auto &&ec, auto &&results) {
              if (ec) {
                return self->finish(Unavailable{ec.message()});
              }
              beast::get_lowest_layer(self->ws).async_connect(
                  results, [self](auto &&ec, auto &&) {
                    if (ec) {
                      return self->finish(Unavailable{ec.message()});
                    }
                    self->handshake();
                  });
            });
      }

      void handshake() {
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::client));
        ws.read_message_max(config.max_message_size);
        ws.async_handshake(config.host + ":" + config.port,
                           config.target,
                           [self{shared_from_this()}](auto &&ec) {
                             if (ec) {
                               return self->finish(Errored{ec.message()});
                             }
                             self->send();
                           });
      }

      void send() {
        ws.binary(true);
        const auto &key{request.content->content_id.bytes()};
        ws.async_write(net::buffer(key.data(), key.size()),
                       [self{shared_from_this()}](auto &&ec, auto &&) {
                         if (ec) {
                           return self->finish(Errored{ec.message()});
                         }
                         self->receive();
                       });
      }

      void receive() {
        ws.async_read(buffer, [self{shared_from_this()}](auto &&ec, auto &&) {
          if (ec) {
            return self->finish(Errored{ec.message()});
          }
          self->onReply();
        });
      }

      void onReply() {
        const auto data{buffer.cdata()};
        const auto *begin{static_cast<const uint8_t *>(data.data())};
        if (data.size() == 0) {
          return finish(Errored{"empty reply"});
        }
        const auto status{static_cast<SocketReplyStatus>(begin[0])};
        if (status == SocketReplyStatus::kNotFound) {
          return finish(Unavailable{"content not found on server"});
        }
        if (status != SocketReplyStatus::kOk) {
          return finish(Errored{"unexpected reply status"});
        }
        Bytes body{begin + 1, begin + data.size()};
        const auto size{body.size()};
        if (request.on_progress) {
          request.on_progress(size, size);
        }
        finish(Delivered{std::move(body), size});
        ws.async_close(websocket::close_code::normal,
                       [self{shared_from_this()}](auto &&) {});
      }

      /// Called from the cancel token, any thread
      void interrupt() {
        net::post(strand, [self{shared_from_this()}] {
          self->finish(Errored{"cancelled"});
          self->resolver.cancel();
          boost::system::error_code ec;
          beast::get_lowest_layer(self->ws).socket().close(ec);
        });
      }

      void finish(AttemptOutcome outcome) {
        done(std::move(outcome));
      }

      net::strand<io_context::executor_type> strand;
      tcp::resolver resolver;
      websocket::stream<beast::tcp_stream> ws;
      beast::flat_buffer buffer;
      SocketChannelConfig config;
      AttemptRequest request;
      AttemptOnce done;
    };
  }  // namespace

  SocketChannelTransport::SocketChannelTransport(io_context &io,
                                                 SocketChannelConfig config)
      : io_{io},
        config_{std::move(config)},
        logger_{common::createLogger("SocketChannel")} {}

  TransportName SocketChannelTransport::name() const {
    return TransportName::kSocketChannel;
  }

  void SocketChannelTransport::attempt(AttemptRequest request,
                                       AttemptCallback cb) {
    logger_->debug("session {}: connecting to {}:{}{}",
                   request.session_id,
                   config_.host,
                   config_.port,
                   config_.target);
    auto session{std::make_shared<ChannelSession>(
        io_, config_, std::move(request), std::move(cb))};
    if (session->request.cancel) {
      session->request.cancel->onCancel(
          [weak{std::weak_ptr<ChannelSession>{session}}] {
            if (auto session{weak.lock()}) {
              session->interrupt();
            }
          });
    }
    session->run();
  }

}  // namespace ferry::transport
