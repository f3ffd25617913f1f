#include "application/WatchlistValidator.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace ibtrader::application {

using domain::EngineException;
using domain::ErrorCode;
using namespace ports::output;

WatchlistValidator::WatchlistValidator(
    EventLoop& loop,
    const settings::EngineConfig& config,
    std::shared_ptr<ConnectionManager> connection
) : timeout_(config.validationTimeout)
  , connection_(std::move(connection))
  , strand_(loop.makeStrand())
{}

void WatchlistValidator::attach(BrokerMessageDispatcher& dispatcher) {
    std::weak_ptr<WatchlistValidator> weak = weak_from_this();

    dispatcher.route<ContractDetailsMessage>(strand_, [weak](const ContractDetailsMessage& m) {
        if (auto self = weak.lock()) {
            self->complete(m.reqId, [&m](PendingRequest& r) { r.details.push_back(m); }, false);
        }
    });
    dispatcher.route<ContractDetailsEndMessage>(strand_, [weak](const ContractDetailsEndMessage& m) {
        if (auto self = weak.lock()) {
            self->complete(m.reqId, [](PendingRequest&) {}, true);
        }
    });
    dispatcher.route<OptionParamsMessage>(strand_, [weak](const OptionParamsMessage& m) {
        if (auto self = weak.lock()) {
            self->complete(m.reqId, [&m](PendingRequest& r) { r.params.push_back(m); }, false);
        }
    });
    dispatcher.route<OptionParamsEndMessage>(strand_, [weak](const OptionParamsEndMessage& m) {
        if (auto self = weak.lock()) {
            self->complete(m.reqId, [](PendingRequest&) {}, true);
        }
    });
    dispatcher.route<ErrorMessage>(strand_, [weak](const ErrorMessage& m) {
        if (auto self = weak.lock()) {
            self->complete(static_cast<int>(m.id), [&m](PendingRequest& r) { r.error = m; }, true);
        }
    });
}

void WatchlistValidator::complete(int reqId,
                                  const std::function<void(PendingRequest&)>& update,
                                  bool finish) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(reqId);
    if (it == pending_.end() || it->second->completed) {
        return;     // Чужой id или запрос уже завершён по таймауту
    }
    update(*it->second);
    if (finish) {
        it->second->completed = true;
        it->second->done.set_value();
        pending_.erase(it);
    }
}

template <typename SendFn>
std::shared_ptr<WatchlistValidator::PendingRequest> WatchlistValidator::request(
    SendFn&& sendFn,
    std::chrono::steady_clock::time_point deadline
) {
    int reqId = connection_->nextRequestId();
    auto pending = std::make_shared<PendingRequest>();
    auto ready = pending->done.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[reqId] = pending;
    }

    try {
        connection_->send([&](IBrokerSession& broker) { sendFn(broker, reqId); });
    } catch (...) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(reqId);
        throw;
    }

    if (ready.wait_until(deadline) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(reqId);
        return nullptr;
    }
    return pending;
}

ValidationResult WatchlistValidator::validate(const std::string& ticker) {
    ValidationResult result;
    result.symbol = ticker;
    std::transform(result.symbol.begin(), result.symbol.end(), result.symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (result.symbol.empty()) {
        result.code = ErrorCode::INVALID_REQUEST;
        result.error = "Ticker is empty";
        return result;
    }
    if (stopped_) {
        result.code = ErrorCode::NOT_CONNECTED;
        result.error = "Validator is stopped";
        return result;
    }

    std::cout << "[WatchlistValidator] Validating ticker: " << result.symbol << std::endl;
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    const std::string symbol = result.symbol;

    try {
        // 1. Контракт акции
        auto details = request([&symbol](IBrokerSession& broker, int reqId) {
            broker.requestContractDetails(reqId, domain::Contract::stock(symbol));
        }, deadline);

        if (!details) {
            result.code = ErrorCode::VALIDATION_TIMEOUT;
            result.error = "Validation of " + symbol + " timed out";
            return result;
        }
        if (stopped_) {
            result.code = ErrorCode::NOT_CONNECTED;
            result.error = "Validator is stopped";
            return result;
        }
        if (details->details.empty()) {
            result.code = ErrorCode::UNKNOWN_SYMBOL;
            result.error = "Invalid ticker symbol: " + symbol;
            if (details->error) {
                result.error += " (" + details->error->text + ")";
            }
            return result;
        }
        result.conId = details->details.front().conId;

        // 2. Опционная цепочка
        auto options = request([&symbol, conId = result.conId](IBrokerSession& broker, int reqId) {
            broker.requestOptionParams(reqId, symbol, conId);
        }, deadline);

        if (!options) {
            result.code = ErrorCode::VALIDATION_TIMEOUT;
            result.error = "Validation of " + symbol + " timed out";
            return result;
        }
        if (stopped_) {
            result.code = ErrorCode::NOT_CONNECTED;
            result.error = "Validator is stopped";
            return result;
        }

        const OptionParamsMessage* chosen = nullptr;
        for (const auto& p : options->params) {
            if (p.expirations.empty() || p.strikes.empty()) {
                continue;
            }
            if (!chosen || p.tradingClass == symbol) {
                chosen = &p;
            }
            if (p.tradingClass == symbol) {
                break;
            }
        }
        if (!chosen) {
            result.code = ErrorCode::NO_OPTIONS_AVAILABLE;
            result.error = symbol + " does not support options trading";
            return result;
        }

        result.chain.symbol = symbol;
        result.chain.underlyingConId = result.conId;
        result.chain.exchange = chosen->exchange;
        result.chain.tradingClass = chosen->tradingClass;
        result.chain.multiplier = chosen->multiplier;
        result.chain.expirations = chosen->expirations;
        result.chain.strikes = chosen->strikes;
        std::sort(result.chain.expirations.begin(), result.chain.expirations.end());
        std::sort(result.chain.strikes.begin(), result.chain.strikes.end());
    } catch (const EngineException& e) {
        result.code = e.code();
        result.error = e.what();
        return result;
    }

    std::cout << "[WatchlistValidator] " << symbol << " is valid and supports options trading ("
              << result.chain.expirations.size() << " expirations, "
              << result.chain.strikes.size() << " strikes)" << std::endl;
    result.success = true;
    return result;
}

void WatchlistValidator::shutdown() {
    stopped_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : pending_) {
        if (!entry.second->completed) {
            entry.second->completed = true;
            entry.second->done.set_value();
        }
    }
    pending_.clear();
}

} // namespace ibtrader::application
