#pragma once

#include <asio.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hostwatch::test {

/**
 * @brief One request as received on the wire.
 */
struct RecordedRequest {
    std::string head; ///< Request line and headers, without the blank line.
    std::string body;
};

/**
 * @brief HTTP/1.1 server on 127.0.0.1 that answers every request with a fixed status.
 *
 * Connections are handled one at a time on a background thread. Each request
 * is recorded, answered with an empty body and the connection is closed.
 */
class LoopbackHttpServer {
public:
    explicit LoopbackHttpServer(std::string status = "202 Accepted")
        : status_(std::move(status)),
          acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        accept();
        thread_ = std::thread([this] { io_.run(); });
    }

    ~LoopbackHttpServer() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    [[nodiscard]] uint16_t port() const { return acceptor_.local_endpoint().port(); }

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port()) + path;
    }

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] size_t requestCount() const {
        std::lock_guard lock(mutex_);
        return requests_.size();
    }

private:
    void accept() {
        acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec) {
                return;
            }
            handle(socket);
            accept();
        });
    }

    void handle(asio::ip::tcp::socket& socket) {
        asio::error_code ec;
        std::string data;

        size_t headEnd = asio::read_until(socket, asio::dynamic_buffer(data), "\r\n\r\n", ec);
        if (ec) {
            return;
        }

        RecordedRequest request;
        request.head = data.substr(0, headEnd - 4);

        size_t length = contentLength(request.head);
        if (data.size() < headEnd + length) {
            asio::read(socket, asio::dynamic_buffer(data),
                       asio::transfer_exactly(headEnd + length - data.size()), ec);
            if (ec) {
                return;
            }
        }
        request.body = data.substr(headEnd, length);

        {
            std::lock_guard lock(mutex_);
            requests_.push_back(std::move(request));
        }

        std::string response = "HTTP/1.1 " + status_ +
                               "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        asio::write(socket, asio::buffer(response), ec);
        socket.close(ec);
    }

    static size_t contentLength(const std::string& head) {
        std::string lower = head;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto pos = lower.find("content-length:");
        if (pos == std::string::npos) {
            return 0;
        }
        return std::stoul(head.substr(pos + 15));
    }

    std::string status_;
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
};

} // namespace hostwatch::test
