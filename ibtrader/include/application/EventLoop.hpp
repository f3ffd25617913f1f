#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace ibtrader::application {

using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

/**
 * @brief Пул потоков вокруг io_context
 *
 * Все таймеры и обработчики компонентов движка выполняются здесь.
 * Компоненты работают через собственные strand'ы, поэтому число
 * потоков не влияет на порядок событий внутри компонента.
 */
class EventLoop {
public:
    explicit EventLoop(std::size_t threads = 1);

    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();

    /**
     * @brief Остановить и дождаться потоков
     *
     * Необработанные задачи отбрасываются. Повторный вызов безопасен.
     */
    void stop();

    bool isRunning() const { return running_; }

    boost::asio::io_context& context() { return context_; }

    Strand makeStrand() {
        return boost::asio::make_strand(context_);
    }

    /**
     * @brief Является ли текущий поток потоком пула
     */
    bool inLoopThread() const;

private:
    std::size_t threadCount_;
    boost::asio::io_context context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    mutable std::mutex mutex_;
};

} // namespace ibtrader::application
