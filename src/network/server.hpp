#pragma once

#include "network/api_router.hpp"
#include "network/range_streamer.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <string>

namespace segedit::network {

// Owns the io_context and TCP acceptor.
//
// Usage:
//   Server srv{"0.0.0.0", 8765, router, streamer};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    Server(std::string host, std::uint16_t port,
           const ApiRouter& router, const RangeStreamer& streamer);

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Stops the io_context, causing run() to return.
    void stop();

    [[nodiscard]] boost::asio::io_context& io_context() noexcept { return ioc_; }

private:
    // Accept loop coroutine – runs until the acceptor is closed.
    boost::asio::awaitable<void> accept_loop();

    std::string host_;
    std::uint16_t port_;
    const ApiRouter& router_;
    const RangeStreamer& streamer_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace segedit::network
