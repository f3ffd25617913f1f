#pragma once

#include "settings/EngineConfig.hpp"
#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>

namespace ibtrader::ports::input {
    class ITradingTerminal;
}

namespace ibtrader::ports::output {
    class IEventBus;
}

namespace ibtrader::adapters::primary {
    class JsonCommandHandler;
}

namespace ibtrader::adapters::secondary {
    class SimulatedTwsGateway;
}

/**
 * @class BracketApp
 * @brief Приложение IB Bracket Trader
 *
 * Порядок запуска:
 * 1. loadEnvironment() - config.json, переменные окружения, аргументы
 * 2. configureInjection() - Boost.DI собирает движок вокруг шлюза брокера
 * 3. serve() - команды из stdin, ответы и события в stdout
 *
 * stdout занят протоколом, поэтому логи уходят в stderr.
 */
class BracketApp
{
public:
    BracketApp();
    ~BracketApp();

    /**
     * @return Код завершения процесса
     */
    int run(int argc, char* argv[]);

    /**
     * @brief Прервать чтение команд. Можно вызывать из обработчика сигнала.
     */
    void stop();

private:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    void serve(std::istream& input);
    void printStartupBanner();

    ibtrader::settings::EngineConfig config_;
    std::shared_ptr<ibtrader::adapters::secondary::SimulatedTwsGateway> gateway_;
    std::shared_ptr<ibtrader::ports::output::IEventBus> eventBus_;
    std::shared_ptr<ibtrader::ports::input::ITradingTerminal> terminal_;
    std::unique_ptr<ibtrader::adapters::primary::JsonCommandHandler> handler_;

    std::unique_ptr<std::ostream> protocol_;
    std::streambuf* originalCout_ = nullptr;
    std::atomic<bool> running_{false};
};
