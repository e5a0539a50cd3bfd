#include "http_server.hpp"
#include "mapping.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace coop_catalog {

namespace {

http::response<http::string_body>
buildResponse(ApiRouter& router, const http::request<http::string_body>& req)
{
    ApiRouter::Response result;
    try {
        result = router.handle(std::string(req.method_string()),
                               std::string(req.target()),
                               req.body());
    } catch (const std::exception& e) {
        std::cerr << "[HttpServer] Handler failed: " << e.what() << "\n";
        result = ApiRouter::Response{500, detailMessage("Internal Server Error"), true};
    }

    http::response<http::string_body> res{
        static_cast<http::status>(result.status), req.version()};
    res.set(http::field::server, "coop_catalog/1.0");
    if (result.hasBody) {
        res.set(http::field::content_type, "application/json");
        // Replace rather than throw on text that is not valid UTF-8.
        res.body() = result.body.dump(-1, ' ', false,
                                      nlohmann::json::error_handler_t::replace);
    }
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

/// One client connection.  Reads a request, answers it, and keeps reading
/// while the client asks for keep-alive.  Owned by its pending handlers.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, ApiRouter& router, int idleTimeoutMs, bool verbose)
        : mStream(std::move(socket))
        , mRouter(router)
        , mIdleTimeoutMs(idleTimeoutMs)
        , mVerbose(verbose)
    {
    }

    void start() {
        net::dispatch(mStream.get_executor(),
                      beast::bind_front_handler(&Session::doRead, shared_from_this()));
    }

private:
    beast::tcp_stream                 mStream;
    beast::flat_buffer                mBuffer;
    http::request<http::string_body>  mRequest;
    http::response<http::string_body> mResponse;
    ApiRouter&                        mRouter;
    int                               mIdleTimeoutMs;
    bool                              mVerbose;

    void doRead() {
        mRequest = {};
        mStream.expires_after(std::chrono::milliseconds(mIdleTimeoutMs));
        http::async_read(mStream, mBuffer, mRequest,
                         beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            doClose();
            return;
        }
        if (ec == beast::error::timeout) {
            // tcp_stream has already closed the socket.
            if (mVerbose) {
                std::cerr << "[HttpServer] Idle connection timed out\n";
            }
            return;
        }
        if (ec) {
            std::cerr << "[HttpServer] Read failed: " << ec.message() << "\n";
            return;
        }

        mResponse = buildResponse(mRouter, mRequest);
        mStream.expires_after(std::chrono::milliseconds(mIdleTimeoutMs));
        http::async_write(mStream, mResponse,
                          beast::bind_front_handler(&Session::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            std::cerr << "[HttpServer] Write failed: " << ec.message() << "\n";
            return;
        }
        if (!mResponse.keep_alive()) {
            doClose();
            return;
        }
        doRead();
    }

    void doClose() {
        // Graceful close; the peer may already be gone.
        beast::error_code ec;
        mStream.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (mVerbose) {
            std::cerr << "[HttpServer] Connection closed\n";
        }
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpServer::HttpServer(ApiRouter& router,
                       const std::string& address,
                       unsigned short port,
                       bool verbose,
                       int idleTimeoutMs,
                       unsigned int threads)
    : mRouter(router)
    , mVerbose(verbose)
    , mIdleTimeoutMs(idleTimeoutMs)
    , mThreads(threads != 0 ? threads : std::max(1u, std::thread::hardware_concurrency()))
    , mIoc(static_cast<int>(mThreads))
    , mAcceptor(mIoc, tcp::endpoint(net::ip::make_address(address), port))
{
    if (idleTimeoutMs <= 0) {
        throw std::invalid_argument("Idle timeout must be positive");
    }
}

unsigned short HttpServer::port() const {
    return mAcceptor.local_endpoint().port();
}

// ---------------------------------------------------------------------------
// Accept loop
// ---------------------------------------------------------------------------

void HttpServer::run() {
    if (mVerbose) {
        std::cerr << "[HttpServer] Listening on " << mAcceptor.local_endpoint()
                  << " with " << mThreads << " worker thread(s)\n";
    }
    doAccept();

    std::vector<std::thread> workers;
    workers.reserve(mThreads - 1);
    try {
        for (unsigned int i = 1; i < mThreads; ++i) {
            workers.emplace_back([this] { mIoc.run(); });
        }
    } catch (const std::system_error&) {
        mIoc.stop();
        for (auto& t : workers) t.join();
        throw;
    }

    mIoc.run();
    for (auto& t : workers) {
        t.join();
    }

    if (mVerbose) {
        std::cerr << "[HttpServer] Stopped\n";
    }
}

void HttpServer::stop() {
    mIoc.stop();
}

void HttpServer::doAccept() {
    mAcceptor.async_accept(net::make_strand(mIoc),
                           [this](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }

        if (ec) {
            std::cerr << "[HttpServer] Accept failed: " << ec.message() << "\n";
        } else {
            if (mVerbose) {
                beast::error_code peerEc;
                std::cerr << "[HttpServer] Connection from "
                          << socket.remote_endpoint(peerEc) << "\n";
            }
            std::make_shared<Session>(std::move(socket), mRouter,
                                      mIdleTimeoutMs, mVerbose)->start();
        }

        doAccept();
    });
}

} // namespace coop_catalog
