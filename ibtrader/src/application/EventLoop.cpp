#include "application/EventLoop.hpp"
#include <algorithm>
#include <iostream>

namespace ibtrader::application {

EventLoop::EventLoop(std::size_t threads)
    : threadCount_(std::max<std::size_t>(1, threads))
{}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }

    context_.restart();
    work_.emplace(boost::asio::make_work_guard(context_));
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this]() {
            // Исключение из обработчика не должно останавливать поток
            for (;;) {
                try {
                    context_.run();
                    break;
                } catch (const std::exception& e) {
                    std::cerr << "[EventLoop] Handler threw: " << e.what() << std::endl;
                }
            }
        });
    }
    running_ = true;
    std::cout << "[EventLoop] Started with " << threadCount_ << " thread(s)" << std::endl;
}

void EventLoop::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return;
    }

    work_.reset();
    context_.stop();
    for (auto& t : threads_) {
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
            t.join();
        } else if (t.joinable()) {
            t.detach();
        }
    }
    threads_.clear();
    running_ = false;
    std::cout << "[EventLoop] Stopped" << std::endl;
}

bool EventLoop::inLoopThread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto self = std::this_thread::get_id();
    return std::any_of(threads_.begin(), threads_.end(),
                       [self](const std::thread& t) { return t.get_id() == self; });
}

} // namespace ibtrader::application
