#include "BracketApp.hpp"

#include "adapters/primary/JsonCommandHandler.hpp"
#include "adapters/secondary/broker/SimulatedTwsGateway.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/settings/JsonEngineConfigLoader.hpp"
#include "application/TradingTerminal.hpp"
#include "ports/input/ITradingTerminal.hpp"
#include "ports/output/IBrokerSession.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventBus.hpp"

#include <boost/di.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace di = boost::di;

using namespace ibtrader;

namespace config
{
    constexpr const char* DEFAULT_CONFIG_PATH = "config.json";
    constexpr std::chrono::milliseconds SIMULATOR_TICK{1000};
}

BracketApp::BracketApp()
{
    std::cerr << "[BracketApp] Application created" << std::endl;
}

BracketApp::~BracketApp()
{
    if (terminal_) {
        terminal_->shutdown();
    }
    if (gateway_) {
        gateway_->stopTicker();
    }
    if (originalCout_) {
        std::cout.rdbuf(originalCout_);
    }
    std::cerr << "[BracketApp] Application destroyed" << std::endl;
}

int BracketApp::run(int argc, char* argv[])
{
    // Протокол пишется в настоящий stdout, всё остальное в stderr
    originalCout_ = std::cout.rdbuf(std::cerr.rdbuf());
    protocol_ = std::make_unique<std::ostream>(originalCout_);

    loadEnvironment(argc, argv);
    configureInjection();

    running_ = true;
    serve(std::cin);

    std::cout << "[BracketApp] Input closed, shutting down" << std::endl;
    terminal_->shutdown();
    gateway_->stopTicker();
    return 0;
}

void BracketApp::stop()
{
    running_ = false;
    // getline в serve() получит EOF
    ::close(STDIN_FILENO);
}

/**
 * @brief ibtrader [config.json] [host port clientId]
 */
void BracketApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[BracketApp] Loading environment..." << std::endl;

    int next = 1;
    std::string path = config::DEFAULT_CONFIG_PATH;
    bool explicitPath = false;
    if (argc > next) {
        std::string first = argv[next];
        if (first.size() > 5 && first.compare(first.size() - 5, 5, ".json") == 0) {
            path = first;
            explicitPath = true;
            ++next;
        }
    }

    if (std::ifstream(path).good()) {
        config_ = adapters::secondary::JsonEngineConfigLoader::loadFile(path);
        std::cout << "[BracketApp] Configuration loaded from " << path << std::endl;
    } else if (explicitPath) {
        throw std::runtime_error("Cannot open config file: " + path);
    } else {
        std::cout << "[BracketApp] " << path << " not found, using defaults" << std::endl;
    }

    adapters::secondary::JsonEngineConfigLoader::applyEnvironment(config_);

    try {
        if (argc > next) config_.host = argv[next];
        if (argc > next + 1) config_.port = std::stoi(argv[next + 1]);
        if (argc > next + 2) config_.clientId = std::stoi(argv[next + 2]);
    } catch (const std::logic_error& e) {
        throw std::runtime_error(std::string("Invalid command line argument: ") + e.what());
    }

    std::cout << "[BracketApp] Broker endpoint " << config_.host << ":" << config_.port
              << " clientId=" << config_.clientId << std::endl;
}

void BracketApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[BracketApp] Configuring Boost.DI injection..." << std::endl;

    gateway_ = std::make_shared<adapters::secondary::SimulatedTwsGateway>();

    auto injector = di::make_injector(
        di::bind<settings::EngineConfig>().to(config_),

        // IBrokerSession <- SimulatedTwsGateway (общий экземпляр, им управляет тикер)
        di::bind<ports::output::IBrokerSession>().to(gateway_),

        di::bind<ports::output::IEventBus>()
            .to<adapters::secondary::InMemoryEventBus>()
            .in(di::singleton),

        di::bind<ports::output::IClock>()
            .to<ports::output::SystemClock>()
            .in(di::singleton),

        di::bind<ports::input::ITradingTerminal>()
            .to<application::TradingTerminal>()
            .in(di::singleton));

    eventBus_ = injector.create<std::shared_ptr<ports::output::IEventBus>>();
    terminal_ = injector.create<std::shared_ptr<ports::input::ITradingTerminal>>();

    std::cout << "[BracketApp] Engine assembled" << std::endl;

    handler_ = std::make_unique<adapters::primary::JsonCommandHandler>(
        terminal_,
        eventBus_,
        [this](const std::string& line) {
            *protocol_ << line << '\n';
            protocol_->flush();
        });
    handler_->forwardEvents();

    gateway_->startTicker(config::SIMULATOR_TICK);
}

void BracketApp::serve(std::istream& input)
{
    std::cout << "[BracketApp] Waiting for commands on stdin" << std::endl;

    std::string line;
    while (running_ && std::getline(input, line)) {
        handler_->handleLine(line);
    }
}

void BracketApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║            IB Bracket Trader - Options Engine        ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Runtime:      Boost.Asio strands                    ║" << std::endl;
    std::cout << "║  Protocol:     JSON lines on stdin/stdout            ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
