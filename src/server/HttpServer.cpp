#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "server/Logger.hpp"
#include <stdexcept>

namespace graphstore {
namespace server {

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
                       RequestHandler& handler)
    : m_ioc(ioc)
    , m_acceptor(net::make_strand(ioc))
    , m_handler(handler)
    , m_running(false)
{
    beast::error_code ec;

    auto bindAddress = net::ip::make_address(address, ec);
    if (ec) {
        throw std::invalid_argument("Invalid listen address '" + address + "': " + ec.message());
    }
    auto endpoint = tcp::endpoint(bindAddress, port);

    // Ouvrir l'acceptor
    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    // Permettre la réutilisation de l'adresse
    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set reuse_address: " + ec.message());
    }

    // Lier à l'endpoint
    m_acceptor.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind " + address + ":" + std::to_string(port) +
                                 ": " + ec.message());
    }

    // Commencer à écouter
    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }

    LOG_INFO("Server listening on http://" + address + ":" + std::to_string(this->port()));
}

void HttpServer::run() {
    m_running = true;
    doAccept();
}

void HttpServer::stop() {
    m_running = false;
    net::post(m_acceptor.get_executor(), [this]() {
        beast::error_code ec;
        m_acceptor.close(ec);
    });
}

unsigned short HttpServer::port() const {
    beast::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::doAccept() {
    if (!m_running) return;

    m_acceptor.async_accept(
        net::make_strand(m_ioc),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), m_handler)->run();
            } else if (ec != net::error::operation_aborted) {
                LOG_WARN("Accept error: " + ec.message());
            }

            if (m_running) {
                doAccept();
            }
        });
}

} // namespace server
} // namespace graphstore
