#include "network/session.hpp"

#include "network/json_codec.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <variant>

namespace segedit::network {

namespace {
constexpr std::string_view kHeadTerminator = "\r\n\r\n";
} // namespace

Session::Session(boost::asio::ip::tcp::socket socket,
                 const ApiRouter& router,
                 const RangeStreamer& streamer)
    : socket_(std::move(socket)), router_(router), streamer_(streamer) {
    boost::system::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
}

boost::asio::awaitable<bool> Session::send(const HttpResponse& response, bool keep_alive) {
    boost::system::error_code ec;
    const std::string wire = serialize_response(response, keep_alive);
    co_await boost::asio::async_write(socket_, boost::asio::buffer(wire),
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("Session {}: write error: {}", remote_, ec.message());
        co_return false;
    }
    co_return true;
}

boost::asio::awaitable<void> Session::run() {
    spdlog::debug("Session {}: connected", remote_);

    std::string buf;
    buf.reserve(1024);

    for (;;) {
        // ── Read the request head ─────────────────────────────────────────────
        boost::system::error_code ec;
        const std::size_t head_len = co_await boost::asio::async_read_until(
            socket_, boost::asio::dynamic_buffer(buf, kMaxHeadBytes), kHeadTerminator,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec == boost::asio::error::not_found) {
                co_await send(error_response(431, "Request header fields too large"), false);
            } else if (ec != boost::asio::error::eof &&
                       ec != boost::asio::error::connection_reset &&
                       ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Session {}: read error: {}", remote_, ec.message());
            }
            break;
        }

        auto parsed = parse_request_head(std::string_view{buf}.substr(0, head_len));
        buf.erase(0, head_len);

        if (auto* err = std::get_if<HttpError>(&parsed)) {
            spdlog::debug("Session {}: bad request: {}", remote_, err->message);
            co_await send(error_response(err->status, err->message), false);
            break;
        }
        auto& request = std::get<HttpRequest>(parsed);

        // ── Read the body (Content-Length framed) ─────────────────────────────
        const std::size_t body_len = request.content_length();
        if (buf.size() < body_len) {
            const std::size_t have = buf.size();
            buf.resize(body_len);
            co_await boost::asio::async_read(
                socket_, boost::asio::buffer(buf.data() + have, body_len - have),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                spdlog::debug("Session {}: body read error: {}", remote_, ec.message());
                break;
            }
        }
        request.body = buf.substr(0, body_len);
        buf.erase(0, body_len);

        const bool keep_alive = request.keep_alive();
        spdlog::debug("Session {}: {} {}", remote_, request.method, request.target);

        // ── Dispatch ──────────────────────────────────────────────────────────
        auto result = router_.handle(request);

        if (auto* response = std::get_if<HttpResponse>(&result)) {
            response->set_header("Access-Control-Allow-Origin", "*");
            spdlog::info("{} {} {} {}", remote_, request.method, request.target, response->status);
            if (!co_await send(*response, keep_alive) || !keep_alive) {
                break;
            }
            continue;
        }

        auto& stream = std::get<PreparedStream>(result);
        stream.head.set_header("Access-Control-Allow-Origin", "*");
        spdlog::info("{} {} {} {} ({} bytes)", remote_, request.method, request.target,
                     stream.head.status, stream.content_length);

        const auto outcome = co_await streamer_.stream(socket_, stream, keep_alive);
        if (!outcome.complete(stream) || !keep_alive) {
            break;
        }
    }

    boost::system::error_code ignored;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    spdlog::debug("Session {}: disconnected", remote_);
}

} // namespace segedit::network
