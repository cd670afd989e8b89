#pragma once

#include "core/services/IProber.hpp"

#include <asio.hpp>
#include <chrono>
#include <string>

namespace hostwatch::infra {

/**
 * @brief Reachability probe based on TCP connection establishment.
 *
 * Each attempt resolves the host, then connects to the resolved endpoints in
 * turn, both within the timeout. Name resolution is a blocking system call
 * that cannot be interrupted, so a stalled DNS server can hold one attempt
 * past the timeout; the attempt then fails without connecting. The
 * connection is closed as soon as it is established; no data is exchanged.
 * Implements core::IProber and is safe to call from several threads at once.
 */
class TcpProber : public core::IProber {
public:
    TcpProber() = default;
    ~TcpProber() override = default;

    /**
     * @brief Probes host:port with up to @p retries sequential attempts.
     * @param host Hostname or IP address.
     * @param port TCP port.
     * @param timeout Connect timeout per attempt.
     * @param retries Attempt count; values below one are treated as one.
     * @return True on the first attempt that connects.
     */
    bool probe(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
               int retries) override;

private:
    asio::error_code attemptConnect(const std::string& host, uint16_t port,
                                    std::chrono::milliseconds timeout);
};

} // namespace hostwatch::infra
