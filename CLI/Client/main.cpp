#include "Core/Client/Client.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    // Логгер поднимаем сразу с настройками по умолчанию, затем
    // пересобираем по конфигу.
    Logger::Guard logger(Logger::Options{});

    Config::Settings settings;
    try
    {
        settings = Config::Load(Config::GetPath());
        logger.Reset(settings.log);
    }
    catch (const std::exception &e)
    {
        LOGE("config") << "Config load failed: " << e.what();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::vector<std::string> args(argv, argv + argc);
    return Client::Run(args, settings, std::cout, std::cerr);
}
