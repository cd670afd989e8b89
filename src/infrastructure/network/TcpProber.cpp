#include "infrastructure/network/TcpProber.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::infra {

bool TcpProber::probe(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                      int retries) {
    const int attempts = retries > 0 ? retries : 1;

    for (int i = 0; i < attempts; ++i) {
        auto ec = attemptConnect(host, port, timeout);
        if (!ec) {
            spdlog::debug("TCP probe {}:{} succeeded on attempt {}", host, port, i + 1);
            return true;
        }
        spdlog::debug("TCP attempt {} failed for {}: {}", i + 1, host, ec.message());
    }

    return false;
}

asio::error_code TcpProber::attemptConnect(const std::string& host, uint16_t port,
                                           std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    asio::io_context io;
    asio::error_code ec;

    asio::ip::tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return ec;
    }

    // Resolution time counts against the attempt.
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return asio::error::timed_out;
    }

    asio::ip::tcp::socket socket(io);
    asio::error_code connectResult = asio::error::would_block;

    asio::async_connect(socket, endpoints,
                        [&connectResult](const asio::error_code& result,
                                         const asio::ip::tcp::endpoint&) {
                            connectResult = result;
                        });

    io.run_for(remaining);

    if (connectResult == asio::error::would_block) {
        // Closing the socket aborts the pending connect; drain its handler.
        socket.close(ec);
        io.run();
        return asio::error::timed_out;
    }

    socket.close(ec);
    return connectResult;
}

} // namespace hostwatch::infra
