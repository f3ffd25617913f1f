#pragma once

#include "application/BrokerMessageDispatcher.hpp"
#include "application/ConnectionManager.hpp"
#include "application/EventLoop.hpp"
#include "domain/EngineError.hpp"
#include "domain/OptionChain.hpp"
#include "settings/EngineConfig.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ibtrader::application {

/**
 * @brief Результат проверки тикера
 */
struct ValidationResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    std::string symbol;                 ///< В верхнем регистре
    int64_t conId = 0;
    domain::OptionChainParams chain;
};

/**
 * @brief Проверка, что тикер торгуется и у него есть опционы
 *
 * Два запроса к брокеру: contract details по акции, затем параметры
 * опционной цепочки по conId. Общий лимит времени - validationTimeout.
 *
 * validate() блокирует вызывающий поток; вызывать его из потоков
 * EventLoop нельзя, ответы брокера обрабатываются там же.
 */
class WatchlistValidator : public std::enable_shared_from_this<WatchlistValidator> {
public:
    WatchlistValidator(
        EventLoop& loop,
        const settings::EngineConfig& config,
        std::shared_ptr<ConnectionManager> connection
    );

    void attach(BrokerMessageDispatcher& dispatcher);

    /**
     * @return UNKNOWN_SYMBOL, NO_OPTIONS_AVAILABLE, VALIDATION_TIMEOUT
     *         или NOT_CONNECTED при неудаче
     */
    ValidationResult validate(const std::string& ticker);

    /**
     * @brief Прервать ожидающие проверки
     */
    void shutdown();

private:
    struct PendingRequest {
        std::promise<void> done;
        bool completed = false;
        std::vector<ports::output::ContractDetailsMessage> details;
        std::vector<ports::output::OptionParamsMessage> params;
        std::optional<ports::output::ErrorMessage> error;
    };

    std::chrono::milliseconds timeout_;
    std::shared_ptr<ConnectionManager> connection_;
    Strand strand_;

    std::mutex mutex_;
    std::unordered_map<int, std::shared_ptr<PendingRequest>> pending_;
    std::atomic<bool> stopped_{false};

    /**
     * @brief Отправить запрос и дождаться его завершения
     * @return nullptr при таймауте
     */
    template <typename SendFn>
    std::shared_ptr<PendingRequest> request(SendFn&& sendFn,
                                            std::chrono::steady_clock::time_point deadline);

    void complete(int reqId, const std::function<void(PendingRequest&)>& update, bool finish);
};

} // namespace ibtrader::application
