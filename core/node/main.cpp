/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <csignal>
#include <iostream>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/sinks/basic_file_sink.h>

#include "api/transfer_api.hpp"
#include "clock/impl/utc_clock_impl.hpp"
#include "common/logger.hpp"
#include "config/config.hpp"
#include "node/transfer_batch.hpp"
#include "transport/impl/socket_channel_transport.hpp"

namespace ferry {
  using api::makeTransferApi;
  using node::TransferBatch;
  using notification::NotificationEvent;
  using orchestrator::FallbackOrchestrator;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger.get();
    }

    constexpr std::chrono::seconds kShutdownTimeout{5};
  }  // namespace

  int main(const config::Config &config) {
    boost::asio::io_context io;
    auto work{boost::asio::make_work_guard(io)};
    std::vector<std::thread> workers;
    for (size_t i{0}; i < config.worker_threads; ++i) {
      workers.emplace_back([&] { io.run(); });
    }

    auto utc_clock{std::make_shared<clock::UTCClockImpl>()};
    auto bus{
        std::make_shared<notification::NotificationBus>(config.bus, utc_clock)};
    auto registry{std::make_shared<registry::SessionRegistry>()};

    FallbackOrchestrator::Transports transports;
    if (config.socket) {
      transports.emplace(
          transport::TransportName::kSocketChannel,
          std::make_shared<transport::SocketChannelTransport>(io,
                                                              *config.socket));
      log()->info("socket channel: {}:{}{}",
                  config.socket->host,
                  config.socket->port,
                  config.socket->target);
    }
    if (transports.empty()) {
      log()->warn("no transport configured, transfers will be exhausted");
    }

    auto orchestrator{
        std::make_shared<FallbackOrchestrator>(config.orchestrator,
                                               io,
                                               std::move(transports),
                                               selector::ProtocolSelector{
                                                   config.selector},
                                               registry,
                                               bus,
                                               utc_clock)};
    auto api{makeTransferApi(orchestrator, bus, utc_clock)};
    api::visit(*api, [](auto &method) {
      log()->debug("api method {}", method.name);
    });

    bus->subscribe({}, [](const NotificationEvent &event) {
      log()->info("{} {} session {}: {}",
                  clock::microTimeToString(event.timestamp),
                  toString(event.kind),
                  event.session_id ? std::to_string(*event.session_id) : "-",
                  describe(event));
    });
    TransferBatch batch{orchestrator};
    auto sessions{batch.request(config.content_ids)};

    boost::asio::signal_set signals{io, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code &ec, int signal) {
      if (ec) {
        return;
      }
      log()->warn("signal {}, cancelling transfers", signal);
      for (auto id : sessions) {
        if (auto cancelled{api->CancelTransfer(id)}; !cancelled) {
          log()->warn("cancel {}: {}", id, cancelled.error().message());
        }
      }
    });

    batch.wait();
    if (not orchestrator->shutdown(kShutdownTimeout)) {
      log()->warn("some transfers did not settle");
    }
    bus->stop();
    signals.cancel();
    work.reset();
    for (auto &worker : workers) {
      worker.join();
    }
    log()->info("{} transfer(s) succeeded, {} failed",
                batch.succeeded(),
                batch.failed());
    return batch.failed() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }
}  // namespace ferry

int main(int argc, char *argv[]) {
  ferry::config::Config config;
  try {
    config = ferry::config::Config::read(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "Cannot parse options: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  if (config.log_file) {
    using ferry::common::file_sink;
    file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.log_file);
    spdlog::default_logger()->sinks().push_back(file_sink);
  }
  spdlog::set_level(config.log_level);
  return ferry::main(config);
}
