/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>

namespace ferry {
  /**
   * io_context running on its own thread.
   * join() lets already posted handlers finish, destructor abandons them.
   */
  struct IoThread {
    inline IoThread()
        : io{std::make_shared<boost::asio::io_context>()},
          work{io->get_executor()},
          thread{[this] { io->run(); }} {}
    IoThread(const IoThread &) = delete;
    IoThread &operator=(const IoThread &) = delete;
    inline ~IoThread() {
      io->stop();
      if (thread.joinable()) {
        thread.join();
      }
    }

    inline bool isCurrent() const {
      return std::this_thread::get_id() == thread.get_id();
    }

    inline void join() {
      work.reset();
      if (thread.joinable() && !isCurrent()) {
        thread.join();
      }
    }

    std::shared_ptr<boost::asio::io_context> io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work;
    std::thread thread;
  };
}  // namespace ferry
