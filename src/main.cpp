#include "core/file_access.hpp"
#include "core/filesystem_media_source.hpp"
#include "core/media_resolution_service.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <optional>
#include <string>

namespace
{
    enum class Command
    {
        NONE,
        QUERY,
        TEXT,
        VALIDATE,
        LATEST,
        CONTEXT
    };

    void printUsage(const char *program)
    {
        std::cout << "Media Resolver - on-device media resolution and validation" << std::endl;
        std::cout << "Usage: " << program << " [options] <command>" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config <file>       Configuration file (default: config.json)" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  --query <file|->      Resolve a query JSON object and print the candidates" << std::endl;
        std::cout << "  --text \"<query>\"      Resolve a raw text query and print the candidates" << std::endl;
        std::cout << "  --validate <uri>      Validate a stored media URI" << std::endl;
        std::cout << "  --latest [directory]  Print the newest image, optionally within a directory" << std::endl;
        std::cout << "  --context [limit]     Print the recent media context (default limit: 25)" << std::endl;
    }

    bool hasValue(int i, int argc, char *argv[])
    {
        return i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
    }

    std::string readQueryInput(const std::string &source)
    {
        if (source == "-")
        {
            return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
        std::ifstream in(source);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open query file: " + source);
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = "config.json";
    Command command = Command::NONE;
    std::string argument;
    bool has_argument = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config")
        {
            if (!hasValue(i, argc, argv))
            {
                std::cerr << "Error: --config requires a file path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        }
        else if (arg == "--query" || arg == "--text" || arg == "--validate")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return 1;
            }
            command = arg == "--query" ? Command::QUERY : (arg == "--text" ? Command::TEXT : Command::VALIDATE);
            argument = argv[++i];
            has_argument = true;
        }
        else if (arg == "--latest" || arg == "--context")
        {
            command = arg == "--latest" ? Command::LATEST : Command::CONTEXT;
            if (hasValue(i, argc, argv))
            {
                argument = argv[++i];
                has_argument = true;
            }
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            std::cerr << "Use --help or -h for usage." << std::endl;
            return 1;
        }
    }

    if (command == Command::NONE)
    {
        printUsage(argv[0]);
        return 1;
    }

    PocoConfigManager config_manager;
    if (!std::ifstream(config_path).good())
    {
        Logger::warn("Config file " + config_path + " not found, using defaults");
    }
    else if (!config_manager.load(config_path))
    {
        std::cerr << "Error: cannot load configuration from " << config_path << std::endl;
        return 1;
    }
    if (!config_manager.validateConfig())
    {
        std::cerr << "Error: invalid configuration in " << config_path << std::endl;
        return 1;
    }

    // Initialize logger with configured log level
    Logger::init(config_manager.getLogLevel());

    auto source = std::make_shared<FilesystemMediaSource>(config_manager.getDirectoryConfig(),
                                                          config_manager.getDefaultAlbumRoots());
    auto file_access = std::make_shared<LocalFileAccess>();
    MediaResolutionService service(source, file_access, config_manager.getEngineOptions());

    try
    {
        switch (command)
        {
        case Command::QUERY:
        case Command::TEXT:
        {
            MediaQuery query = command == Command::QUERY
                                   ? MediaQuery::fromJson(nlohmann::json::parse(readQueryInput(argument)))
                                   : MediaQuery::fromText(argument);
            auto records = service.resolveQuery(query, [](const BatchProgress &progress)
                                                { Logger::debug("Batch " + std::to_string(progress.batch_index + 1) + "/" +
                                                                std::to_string(progress.batch_count) + " done"); });
            std::cout << candidatesToJson(records).dump(2) << std::endl;
            break;
        }
        case Command::VALIDATE:
            std::cout << service.validate(argument).toJson().dump(2) << std::endl;
            break;
        case Command::LATEST:
        {
            auto latest = service.latestImage(has_argument ? std::optional<std::string>(argument) : std::nullopt);
            std::cout << (latest ? latest->toJson() : nlohmann::json(nullptr)).dump(2) << std::endl;
            break;
        }
        case Command::CONTEXT:
        {
            size_t limit = has_argument ? static_cast<size_t>(std::stoul(argument)) : 25;
            std::cout << service.recentMediaContext(limit).dump(2) << std::endl;
            break;
        }
        case Command::NONE:
            break;
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        std::cerr << "Error: malformed query JSON: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
