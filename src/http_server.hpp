#pragma once

#include "api_router.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <string>

namespace coop_catalog {

/// HTTP/1.1 front end built on Boost.Beast.
/// Every connection is an asynchronous session on its own strand; run()
/// drives the io_context from a pool of worker threads and joins them
/// before returning, so no connection outlives the server.
class HttpServer {
public:
    /// @param router         Request handler; must outlive the server.
    /// @param address        Listen address, e.g. "0.0.0.0" or "127.0.0.1"
    /// @param port           Listen port; 0 picks a free ephemeral port
    /// @param idleTimeoutMs  A connection that sends nothing for this long is closed
    /// @param threads        Worker threads; 0 = one per hardware thread
    /// @throws boost::system::system_error if the address cannot be bound.
    HttpServer(ApiRouter& router,
               const std::string& address,
               unsigned short port,
               bool verbose = false,
               int idleTimeoutMs = 30000,
               unsigned int threads = 0);

    /// The port actually bound (useful after asking for port 0).
    unsigned short port() const;

    /// Accept and serve connections until stop() is called.
    void run();

    /// Thread-safe; makes run() return once in-flight handlers finish.
    /// Open connections are closed when the server is destroyed.
    void stop();

private:
    ApiRouter&                     mRouter;
    bool                           mVerbose;
    int                            mIdleTimeoutMs;
    unsigned int                   mThreads;
    boost::asio::io_context        mIoc;
    boost::asio::ip::tcp::acceptor mAcceptor;

    void doAccept();
};

} // namespace coop_catalog
