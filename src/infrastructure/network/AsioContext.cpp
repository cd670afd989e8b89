#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::infra {

AsioContext::AsioContext(size_t threadCount, std::string name)
    : threadCount_(threadCount > 0 ? threadCount : 1), name_(std::move(name)) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { workerLoop(i); });
    }

    spdlog::debug("{} pool started with {} threads", name_, threadCount_);
}

void AsioContext::workerLoop(size_t index) {
    while (true) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            ++handlerFailures_;
            spdlog::error("{} {}: unhandled exception in handler: {}", name_, index, e.what());
        }
    }
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::debug("{} pool stopped", name_);
}

} // namespace hostwatch::infra
