/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

namespace ferry::content {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       ContentId *,
                       long) {
    using namespace boost::program_options;
    auto &value{validators::get_single_string(values)};
    if (auto _id{ContentId::fromHex(value)}) {
      out = _id.value();
      return;
    }
    boost::throw_exception(invalid_option_value{value});
  }
}  // namespace ferry::content

namespace ferry::config {
  namespace po = boost::program_options;

  namespace {
    void positive(const char *name, uint64_t value) {
      if (value == 0) {
        boost::throw_exception(po::invalid_option_value{
            std::string{name} + "=" + std::to_string(value)});
      }
    }

    void fraction(const char *name, double value) {
      if (not(value >= 0 && value <= 1)) {
        boost::throw_exception(po::invalid_option_value{
            std::string{name} + "=" + std::to_string(value)});
      }
    }
  }  // namespace

  Config Config::read(int argc, const char *const argv[]) {
    Config config;
    struct {
      char log_level{'i'};
      boost::optional<std::string> config_file;
      uint64_t timeout_p2p_ms{30000};
      uint64_t timeout_socket_ms{10000};
      uint64_t timeout_media_ms{60000};
      uint64_t max_attempt_timeout_ms{600000};
      std::string socket_host;
      std::string socket_port{"8090"};
      std::string socket_target{"/content"};
    } raw;
    auto &orchestrator{config.orchestrator};
    auto &quality{config.orchestrator.quality};

    po::options_description desc("Ferry node options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config,c", po::value(&raw.config_file), "config file");
    option("log,l",
           po::value(&raw.log_level)->default_value(raw.log_level),
           "log level, [e,w,i,d,t]");
    option("log-file", po::value(&config.log_file), "also log to file");
    option("worker-threads",
           po::value(&config.worker_threads)
               ->default_value(config.worker_threads),
           "threads running transfers");
    option("max-sessions",
           po::value(&orchestrator.max_concurrent_sessions)
               ->default_value(orchestrator.max_concurrent_sessions),
           "transfers running at once, the rest are queued");
    option("finished-history",
           po::value(&orchestrator.finished_history)
               ->default_value(orchestrator.finished_history),
           "finished transfers kept for status queries");
    option("subscriber-queue",
           po::value(&config.bus.queue_capacity)
               ->default_value(config.bus.queue_capacity),
           "events buffered per subscriber");

    po::options_description transfer_desc("Transfer options");
    auto transfer_option{transfer_desc.add_options()};
    transfer_option("small-size-threshold",
                    po::value(&config.selector.small_size_threshold)
                        ->default_value(config.selector.small_size_threshold),
                    "content below it may go over the socket channel (bytes)");
    transfer_option("min-throughput",
                    po::value(&orchestrator.min_throughput)
                        ->default_value(orchestrator.min_throughput),
                    "slowest acceptable delivery (bytes/s), sizes timeouts");
    transfer_option(
        "max-attempt-timeout-ms",
        po::value(&raw.max_attempt_timeout_ms)
            ->default_value(raw.max_attempt_timeout_ms),
        "attempt timeout cap");
    transfer_option("timeout-p2p-ms",
                    po::value(&raw.timeout_p2p_ms)
                        ->default_value(raw.timeout_p2p_ms),
                    "peer stream base timeout");
    transfer_option("timeout-socket-ms",
                    po::value(&raw.timeout_socket_ms)
                        ->default_value(raw.timeout_socket_ms),
                    "socket channel base timeout");
    transfer_option("timeout-media-ms",
                    po::value(&raw.timeout_media_ms)
                        ->default_value(raw.timeout_media_ms),
                    "media transport base timeout");
    desc.add(transfer_desc);

    po::options_description quality_desc("Streaming quality options");
    auto quality_option{quality_desc.add_options()};
    quality_option("quality-min-bitrate",
                   po::value(&quality.min_bitrate)
                       ->default_value(quality.min_bitrate));
    quality_option("quality-max-bitrate",
                   po::value(&quality.max_bitrate)
                       ->default_value(quality.max_bitrate));
    quality_option("quality-initial-bitrate",
                   po::value(&quality.initial_bitrate)
                       ->default_value(quality.initial_bitrate));
    quality_option("quality-loss-threshold",
                   po::value(&quality.loss_threshold)
                       ->default_value(quality.loss_threshold));
    quality_option("quality-throughput-margin",
                   po::value(&quality.throughput_margin)
                       ->default_value(quality.throughput_margin));
    quality_option("quality-sustained-samples",
                   po::value(&quality.sustained_samples)
                       ->default_value(quality.sustained_samples));
    desc.add(quality_desc);

    po::options_description socket_desc("Socket channel options");
    auto socket_option{socket_desc.add_options()};
    socket_option("socket-host",
                  po::value(&raw.socket_host),
                  "content server host, enables socket channel");
    socket_option("socket-port",
                  po::value(&raw.socket_port)->default_value(raw.socket_port));
    socket_option(
        "socket-target",
        po::value(&raw.socket_target)->default_value(raw.socket_target));
    desc.add(socket_desc);

    po::options_description hidden;
    hidden.add_options()("content",
                         po::value(&config.content_ids)->composing());
    po::positional_options_description positional;
    positional.add("content", -1);

    po::options_description all;
    all.add(desc).add(hidden);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.count("help") != 0) {
      std::cerr << "Usage: ferry_node [options] [content-id-hex...]\n"
                << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    if (raw.config_file) {
      std::ifstream config_file{*raw.config_file};
      if (not config_file.good()) {
        boost::throw_exception(po::reading_file{raw.config_file->c_str()});
      }
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    positive("worker-threads", config.worker_threads);
    positive("max-sessions", orchestrator.max_concurrent_sessions);
    positive("finished-history", orchestrator.finished_history);
    positive("subscriber-queue", config.bus.queue_capacity);
    positive("quality-sustained-samples", quality.sustained_samples);
    fraction("quality-loss-threshold", quality.loss_threshold);
    fraction("quality-throughput-margin", quality.throughput_margin);
    if (quality.min_bitrate > quality.max_bitrate) {
      boost::throw_exception(po::error{
          "quality-min-bitrate is greater than quality-max-bitrate"});
    }
    quality.initial_bitrate = std::clamp(
        quality.initial_bitrate, quality.min_bitrate, quality.max_bitrate);

    orchestrator.base_timeouts = {
        {transport::TransportName::kPeerStream,
         clock::milliseconds{raw.timeout_p2p_ms}},
        {transport::TransportName::kSocketChannel,
         clock::milliseconds{raw.timeout_socket_ms}},
        {transport::TransportName::kMediaTransport,
         clock::milliseconds{raw.timeout_media_ms}},
    };
    orchestrator.max_attempt_timeout =
        clock::milliseconds{raw.max_attempt_timeout_ms};

    if (not raw.socket_host.empty()) {
      transport::SocketChannelConfig socket;
      socket.host = raw.socket_host;
      socket.port = raw.socket_port;
      socket.target = raw.socket_target;
      config.socket = socket;
    }

    config.log_level = common::logLevelFromChar(raw.log_level);
    return config;
  }

}  // namespace ferry::config
