#include "common/util.hpp"
#include "src/pairlink/server_config.h"
#include "src/pairlink/signaling_server.h"

#include <utility>
#include <boost/asio.hpp>

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? argv[0] : "pairlink_server";
  std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  pairlink::ServerConfig config;
  std::string err;
  switch (pairlink::parse_args(args, &config, &err)) {
    case pairlink::ArgsResult::Help:
      std::cout << pairlink::usage(program);
      return 0;
    case pairlink::ArgsResult::Error:
      std::cerr << err << "\n" << pairlink::usage(program);
      return 2;
    case pairlink::ArgsResult::Run:
      break;
  }

  boost::asio::io_context io;
  pairlink::SignalingServer server(io, config);
  try {
    server.listen();
  } catch (const boost::system::system_error& e) {
    std::cerr << "Failed to listen: " << e.what() << "\n";
    return 1;
  }

  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int) {
    if (ec) return;
    common::log("signal received, shutting down");
    server.stop();
    io.stop();
  });

  const unsigned threads = config.effective_worker_threads();
  common::log("running with " + std::to_string(threads) + " worker thread(s)");
  pairlink::IoThreadPool pool(io, threads);
  pool.join();
  return 0;
}
