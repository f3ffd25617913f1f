#include "BracketApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
BracketApp* g_app = nullptr;

void signalHandler(int signal)
{
    (void)signal;
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        BracketApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        int code = app.run(argc, argv);

        g_app = nullptr;
        std::cerr << "[main] IB Bracket Trader stopped" << std::endl;
        return code;
    }
    catch (const std::exception& e)
    {
        g_app = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
