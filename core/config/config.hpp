/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "content/content_request.hpp"
#include "notification/notification_bus.hpp"
#include "orchestrator/fallback_orchestrator.hpp"
#include "selector/protocol_selector.hpp"
#include "transport/impl/socket_channel_transport.hpp"

namespace ferry::config {

  struct Config {
    spdlog::level::level_enum log_level{spdlog::level::info};
    boost::optional<std::string> log_file;
    /** Threads running the shared io_context */
    size_t worker_threads{2};

    orchestrator::OrchestratorConfig orchestrator;
    selector::SelectorConfig selector;
    notification::BusConfig bus;

    /** Socket channel transport, disabled without a host */
    boost::optional<transport::SocketChannelConfig> socket;

    /** Content the daemon fetches */
    std::vector<content::ContentId> content_ids;

    /**
     * Parses command line and optional config file.
     * Command line wins over the file.
     * @throws boost::program_options::error on invalid options
     */
    static Config read(int argc, const char *const argv[]);
  };

}  // namespace ferry::config
