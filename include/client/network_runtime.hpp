// include/client/network_runtime.hpp

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>

// runs the io_context all network tasks live on in a background thread
class NetworkRuntime {
public:
  NetworkRuntime();
  ~NetworkRuntime();

  NetworkRuntime(const NetworkRuntime &) = delete;
  NetworkRuntime &operator=(const NetworkRuntime &) = delete;

  boost::asio::io_context &context() { return io_context_; }

  // stops the event loop and joins the thread, idempotent
  void stop();

private:
  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  std::thread io_thread_;
};
