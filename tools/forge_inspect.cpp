#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <core/JobSystem.hpp>
#include <core/Logger.hpp>
#include <config/Config.hpp>

#include <ability/AbilityConfig.hpp>
#include <ability/AbilityHash.hpp>
#include <ability/AvatarSkillCompiler.hpp>

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string configPath = "config/forge.json";
    std::optional<std::string> abilitiesPath;
    std::optional<std::string> talentsPath;
    std::optional<uint32_t> avatarId;
    std::optional<uint32_t> lookupHash;
    uint32_t instances = 0;
    bool showHelp = false;
    bool badArgument = false;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            const bool hasValue = i + 1 < argc;

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if ((arg == "-c" || arg == "--config") && hasValue) {
                args.configPath = argv[++i];
            } else if ((arg == "-a" || arg == "--abilities") && hasValue) {
                args.abilitiesPath = argv[++i];
            } else if ((arg == "-t" || arg == "--talents") && hasValue) {
                args.talentsPath = argv[++i];
            } else if (arg == "--avatar" && hasValue) {
                args.avatarId = ParseNumber(argv[++i], args.badArgument);
            } else if (arg == "--hash" && hasValue) {
                args.lookupHash = ParseNumber(argv[++i], args.badArgument);
            } else if (arg == "--instances" && hasValue) {
                args.instances = ParseNumber(argv[++i], args.badArgument);
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                args.badArgument = true;
            }
        }

        return args;
    }

    static uint32_t ParseNumber(const char* text, bool& badArgument) {
        char* end = nullptr;
        unsigned long value = std::strtoul(text, &end, 0);
        if (end == text || *end != '\0' || *text == '-' || value > UINT32_MAX) {
            std::cerr << "Not a number: " << text << "\n";
            badArgument = true;
            return 0;
        }
        return static_cast<uint32_t>(value);
    }

    static void PrintHelp() {
        std::cout << "forge_inspect - ability special inspector\n\n";
        std::cout << "Usage: forge_inspect [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help            Show this help message\n";
        std::cout << "  -c, --config PATH     Settings file (created with defaults if missing)\n";
        std::cout << "  -a, --abilities PATH  Ability config file (overrides data.abilities)\n";
        std::cout << "  -t, --talents PATH    Avatar definition file (overrides data.talents)\n";
        std::cout << "      --avatar ID       Only compile this avatar\n";
        std::cout << "      --hash N          Resolve a name hash and exit\n";
        std::cout << "      --instances N     Clone each compiled depot N times on the job workers\n";
    }
};

int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp || args.badArgument) {
        CommandLineArgs::PrintHelp();
        return args.badArgument ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    auto& config = Forge::Config::Instance();
    if (auto loaded = config.Load(args.configPath); !loaded) {
        std::cerr << "Failed to load settings: " << Forge::ConfigErrorToString(loaded.error()) << "\n";
        return EXIT_FAILURE;
    }

    const auto logging = Forge::LoggingSettings::FromConfig(config);
    const auto data = Forge::DataSettings::FromConfig(config);
    const auto runtime = Forge::RuntimeSettings::FromConfig(config);

    Forge::Logger::Initialize(logging.file, logging.console);
    Forge::Logger::SetLevel(logging.level);

    Forge::Ability::AbilityConfigParser parser;
    auto abilities = parser.ParseFile(args.abilitiesPath.value_or(data.abilities));
    if (!abilities) {
        APP_LOG_ERROR("Failed to load ability configs: {}", abilities.error());
        Forge::Logger::Shutdown();
        return EXIT_FAILURE;
    }

    const auto index = Forge::Ability::NameHashIndex::Build(*abilities, runtime.logHashCollisions);

    if (args.lookupHash) {
        std::cout << *args.lookupHash << " -> " << index.LookupOrUnknown(*args.lookupHash) << "\n";
        Forge::Logger::Shutdown();
        return EXIT_SUCCESS;
    }

    auto definitions = Forge::Ability::LoadAvatarDefinitions(args.talentsPath.value_or(data.talents));
    if (!definitions) {
        APP_LOG_ERROR("Failed to load avatar definitions: {}", definitions.error());
        Forge::Logger::Shutdown();
        return EXIT_FAILURE;
    }

    if (args.instances > 0) {
        Forge::JobSystemConfig jobConfig;
        jobConfig.workerThreads = runtime.workerThreads;
        Forge::JobSystem::Instance().Initialize(jobConfig);
    }

    Forge::Ability::AvatarSkillCompiler compiler(*abilities);
    nlohmann::json output = nlohmann::json::array();
    int exitCode = EXIT_SUCCESS;

    for (const auto& definition : *definitions) {
        if (args.avatarId && definition.avatarId != *args.avatarId) {
            continue;
        }

        auto compiled = compiler.Compile(definition);
        if (!compiled) {
            APP_LOG_ERROR("{}", compiled.error());
            exitCode = EXIT_FAILURE;
            continue;
        }

        nlohmann::json entry;
        entry["avatarId"] = compiled->avatarId;
        entry["depot"] = compiled->depot.ToJson();
        entry["skippedModifiers"] = compiled->FailureCount();

        if (args.instances > 0) {
            try {
                auto clones = Forge::Ability::AvatarSkillCompiler::CloneDepots(compiled->depot, args.instances);
                entry["instances"] = clones.size();
            } catch (const std::exception& e) {
                APP_LOG_ERROR("Cloning depot of avatar {} failed: {}", definition.avatarId, e.what());
                exitCode = EXIT_FAILURE;
            }
        }

        output.push_back(std::move(entry));
    }

    std::cout << output.dump(2) << std::endl;

    Forge::JobSystem::Instance().Shutdown();
    Forge::Logger::Shutdown();
    return exitCode;
}
