/**
 * @file IProber.hpp
 * @brief Interface for host reachability probing.
 *
 * This file defines the abstract interface used by the monitor to check
 * whether a host accepts TCP connections.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace hostwatch::core {

/**
 * @brief Interface for a bounded-retry reachability probe.
 *
 * Implementations fold every failure (name resolution, refusal, timeout)
 * into a false result and must not throw on network errors.
 */
class IProber {
public:
    virtual ~IProber() = default;

    /**
     * @brief Checks whether a TCP connection to host:port can be established.
     * @param host Hostname or IP address.
     * @param port TCP port to connect to.
     * @param timeout Timeout applied to each attempt independently.
     * @param retries Maximum number of sequential attempts.
     * @return True on the first successful connection, false if all attempts fail.
     */
    virtual bool probe(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                       int retries) = 0;
};

} // namespace hostwatch::core
