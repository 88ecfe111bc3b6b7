#pragma once

#include "network/api_router.hpp"
#include "network/range_streamer.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <string>

namespace segedit::network {

// Handles one HTTP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and serves requests
// sequentially (HTTP/1.1 keep-alive) until the client closes, asks for
// Connection: close, sends something unparsable, or an audio body could not
// be delivered in full.
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket,
            const ApiRouter& router,
            const RangeStreamer& streamer);

    // Main coroutine. Returns when the connection closes.
    boost::asio::awaitable<void> run();

private:
    // Writes a complete response. Returns false if the write failed.
    boost::asio::awaitable<bool> send(const HttpResponse& response, bool keep_alive);

    boost::asio::ip::tcp::socket socket_;
    const ApiRouter& router_;
    const RangeStreamer& streamer_;
    std::string remote_;
};

} // namespace segedit::network
