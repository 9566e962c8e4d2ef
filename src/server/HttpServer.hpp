#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace graphstore {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * Serveur HTTP basé sur Boost.Beast
 *
 * Le io_context peut être exécuté par plusieurs threads: chaque session
 * possède son propre strand.
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               RequestHandler& handler);

    void run();
    void stop();

    // Bound port (useful when constructed with port 0)
    unsigned short port() const;

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    RequestHandler& m_handler;
    std::atomic<bool> m_running;
};

} // namespace server
} // namespace graphstore
