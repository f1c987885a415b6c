// src/client/network_runtime.cpp

#include "network_runtime.hpp"

#include <iostream>

NetworkRuntime::NetworkRuntime()
    : work_guard_(boost::asio::make_work_guard(io_context_)) {
  io_thread_ = std::thread([this]() {
    try {
      io_context_.run();
    } catch (const std::exception &e) {
      std::cerr << "[ERROR] IO context error: " << e.what() << std::endl;
    }
  });
}

NetworkRuntime::~NetworkRuntime() { stop(); }

void NetworkRuntime::stop() {
  work_guard_.reset();
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}
