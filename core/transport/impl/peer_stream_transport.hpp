/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/host/host.hpp>
#include <libp2p/peer/peer_info.hpp>

#include "common/logger.hpp"
#include "content/content_store.hpp"
#include "transport/transport.hpp"

namespace ferry::transport {
  using libp2p::Host;
  using libp2p::peer::PeerInfo;

  /// Protocol of the peer-to-peer content exchange
  constexpr auto kPeerStreamProtocol{"/ferry/transfer/1.0.0"};

  enum class PeerStreamStatus : uint8_t {
    kOk = 0,
    kNotFound = 1,
  };

  /**
   * Transport over a libp2p stream to a content provider peer.
   *
   * Request: 4 byte big endian key length, key bytes.
   * Response: status byte, 8 byte big endian body length, body.
   */
  class PeerStreamTransport
      : public Transport,
        public std::enable_shared_from_this<PeerStreamTransport> {
   public:
    /**
     * @param host - libp2p host, provider has to be dialable from it
     * @param provider - peer serving content
     * @param max_content_size - larger responses are rejected
     */
    PeerStreamTransport(std::shared_ptr<Host> host,
                        PeerInfo provider,
                        uint64_t max_content_size);

    TransportName name() const override;

    void attempt(AttemptRequest request, AttemptCallback cb) override;

    /**
     * Answers requests of remote peers from the content store
     */
    static void serve(const std::shared_ptr<Host> &host,
                      std::shared_ptr<content::ContentStore> store);

   private:
    std::shared_ptr<Host> host_;
    PeerInfo provider_;
    uint64_t max_content_size_;

    common::Logger logger_;
  };

}  // namespace ferry::transport
