#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "ControlFlow.hpp"

namespace
{
    std::atomic<bool> CancelRequested{ false };

    void HandleInterrupt(int)
    {
        CancelRequested.store(true);
    }
}

int main(int argc, char* argv[])
{
    if (argc > 2)
    {
        std::cerr << "Usage: DupliCat [ConfigFile]\n";
        return 1;
    }
    const std::string ConfigFile = argc == 2 ? argv[1] : "Config.txt";

    std::signal(SIGINT, HandleInterrupt);

    ControlFlow Flow;
    return Flow.Run(ConfigFile, &CancelRequested);
}
