/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/impl/peer_stream_transport.hpp"

#include <fmt/format.h>
#include <libp2p/connection/stream.hpp>

#include "common/endian.hpp"
#include "transport/attempt_once.hpp"

namespace ferry::transport {
  using libp2p::connection::Stream;

  namespace {
    constexpr size_t kResponseHeaderSize{1 + sizeof(uint64_t)};
    constexpr size_t kChunkSize{64 << 10};
    constexpr uint32_t kMaxKeySize{1024};

    auto log() {
      static common::Logger logger = common::createLogger("PeerStream");
      return logger.get();
    }

    /// State of one outgoing request
    struct Fetch : std::enable_shared_from_this<Fetch> {
      Fetch(AttemptRequest request, AttemptCallback cb, uint64_t max_size)
          : request{std::move(request)},
            done{std::move(cb)},
            max_size{max_size} {}

      void finish(AttemptOutcome outcome) {
        if (done(std::move(outcome)) && stream) {
          stream->close([](auto) {});
        }
      }

      void interrupt() {
        if (done(Errored{"cancelled"}) && stream) {
          stream->reset();
        }
      }

      void sendRequest() {
        const auto &key{request.content->content_id.bytes()};
        frame.clear();
        common::putUint32BigEndian(frame, key.size());
        append(frame, key);
        stream->write(frame,
                      frame.size(),
                      [self{shared_from_this()}](outcome::result<size_t> r) {
                        if (!r) {
                          return self->finish(Errored{r.error().message()});
                        }
                        self->readHeader();
                      });
      }

      void readHeader() {
        header.resize(kResponseHeaderSize);
        stream->read(
            header,
            header.size(),
            [self{shared_from_this()}](outcome::result<size_t> r) {
              if (!r) {
                return self->finish(Errored{r.error().message()});
              }
              const auto status{static_cast<PeerStreamStatus>(self->header[0])};
              if (status == PeerStreamStatus::kNotFound) {
                return self->finish(
                    Unavailable{"content not found at provider"});
              }
              if (status != PeerStreamStatus::kOk) {
                return self->finish(Errored{fmt::format(
                    "unexpected response status {}", self->header[0])});
              }
              self->expected = common::getUint64BigEndian(
                  gsl::make_span(self->header).subspan(1));
              if (self->expected > self->max_size) {
                return self->finish(Errored{fmt::format(
                    "response of {} bytes exceeds limit", self->expected)});
              }
              self->body.reserve(self->expected);
              self->readBody();
            });
      }

      void readBody() {
        if (done.done()) {
          return;
        }
        const auto offset{body.size()};
        if (offset == expected) {
          return finish(Delivered{std::move(body), expected});
        }
        const auto n{std::min<uint64_t>(kChunkSize, expected - offset)};
        body.resize(offset + n);
        stream->read(gsl::make_span(body).subspan(offset, n),
                     n,
                     [self{shared_from_this()}](outcome::result<size_t> r) {
                       if (!r) {
                         return self->finish(Errored{r.error().message()});
                       }
                       if (self->request.on_progress) {
                         self->request.on_progress(self->body.size(),
                                                   self->expected);
                       }
                       self->readBody();
                     });
      }

      AttemptRequest request;
      AttemptOnce done;
      uint64_t max_size;
      std::shared_ptr<Stream> stream;
      Bytes frame;
      Bytes header;
      Bytes body;
      uint64_t expected{};
    };

    /// State of one incoming request
    struct Serve : std::enable_shared_from_this<Serve> {
      Serve(std::shared_ptr<Stream> stream,
            std::shared_ptr<content::ContentStore> store)
          : stream{std::move(stream)}, store{std::move(store)} {}

      void readLength() {
        buffer.resize(sizeof(uint32_t));
        stream->read(buffer,
                     buffer.size(),
                     [self{shared_from_this()}](outcome::result<size_t> r) {
                       if (!r) {
                         log()->debug("request read failed: {}",
                                      r.error().message());
                         return self->stream->reset();
                       }
                       const auto size{common::getUint32BigEndian(self->buffer)};
                       if (size == 0 || size > kMaxKeySize) {
                         log()->warn("rejected request key of {} bytes", size);
                         return self->stream->reset();
                       }
                       self->readKey(size);
                     });
      }

      void readKey(uint32_t size) {
        buffer.resize(size);
        stream->read(buffer,
                     buffer.size(),
                     [self{shared_from_this()}](outcome::result<size_t> r) {
                       if (!r) {
                         return self->stream->reset();
                       }
                       self->respond(content::ContentId{self->buffer});
                     });
      }

      void respond(const content::ContentId &id) {
        buffer.clear();
        auto resolved{store->resolve(id)};
        const Bytes *body{nullptr};
        if (resolved) {
          body = boost::get<Bytes>(&resolved.value());
        }
        if (body) {
          buffer.push_back(static_cast<uint8_t>(PeerStreamStatus::kOk));
          common::putUint64BigEndian(buffer, body->size());
          append(buffer, *body);
          log()->debug("serving {}, {} bytes", id.toHex(), body->size());
        } else {
          buffer.push_back(static_cast<uint8_t>(PeerStreamStatus::kNotFound));
          common::putUint64BigEndian(buffer, 0);
          log()->debug("{} is not servable", id.toHex());
        }
        stream->write(buffer,
                      buffer.size(),
                      [self{shared_from_this()}](outcome::result<size_t> r) {
                        if (!r) {
                          return self->stream->reset();
                        }
                        self->stream->close([self](auto) {});
                      });
      }

      std::shared_ptr<Stream> stream;
      std::shared_ptr<content::ContentStore> store;
      Bytes buffer;
    };
  }  // namespace

  PeerStreamTransport::PeerStreamTransport(std::shared_ptr<Host> host,
                                           PeerInfo provider,
                                           uint64_t max_content_size)
      : host_{std::move(host)},
        provider_{std::move(provider)},
        max_content_size_{max_content_size},
        logger_{common::createLogger("PeerStream")} {}

  TransportName PeerStreamTransport::name() const {
    return TransportName::kPeerStream;
  }

  void PeerStreamTransport::attempt(AttemptRequest request, AttemptCallback cb) {
    auto fetch{std::make_shared<Fetch>(
        std::move(request), std::move(cb), max_content_size_)};
    if (fetch->request.cancel && fetch->request.cancel->isCancelled()) {
      return fetch->finish(Errored{"cancelled"});
    }
    logger_->debug("session {}: opening stream to {}",
                   fetch->request.session_id,
                   provider_.id.toBase58());
    host_->newStream(
        provider_,
        kPeerStreamProtocol,
        [fetch, logger{logger_}](auto _stream) {
          if (!_stream) {
            logger->debug("session {}: cannot open stream: {}",
                          fetch->request.session_id,
                          _stream.error().message());
            return fetch->finish(Unavailable{_stream.error().message()});
          }
          fetch->stream = _stream.value();
          if (fetch->request.cancel) {
            fetch->request.cancel->onCancel(
                [weak{std::weak_ptr<Fetch>{fetch}}] {
                  if (auto fetch{weak.lock()}) {
                    fetch->interrupt();
                  }
                });
          }
          fetch->sendRequest();
        });
  }

  void PeerStreamTransport::serve(const std::shared_ptr<Host> &host,
                                  std::shared_ptr<content::ContentStore> store) {
    host->setProtocolHandler(kPeerStreamProtocol, [store](auto stream) {
      std::make_shared<Serve>(std::move(stream), store)->readLength();
    });
    log()->info("serving {}", kPeerStreamProtocol);
  }

}  // namespace ferry::transport
