#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#ifdef _WIN32
#include <windows.h>
#endif
#include "common/structured_logger.h"
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "common/shutdown_manager.h"
#include "models/script_models.h"
#include "storage/file_script_storage.h"
#include "storage/in_memory_script_storage.h"
#include "ocal/automation_engine.h"
#include "environmental_perception/desktop_screenshot_service.h"
#include "environmental_perception/template_matcher.h"
#include "orchestrator/script_execution_engine.h"

using namespace deskpilot;

namespace {

const char* kVersion = "1.0.0";

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILURE_CODE = 1,
    EXIT_USAGE = 2
};

#ifdef _WIN32
BOOL WINAPI consoleHandler(DWORD signal) {
    if (signal == CTRL_C_EVENT || signal == CTRL_BREAK_EVENT) {
        if (ShutdownManager::getInstance().onInterrupt() > 1) {
            std::_Exit(EXIT_FAILURE_CODE);
        }
        return TRUE;
    }
    return FALSE;
}
#else
void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        // Second interrupt: the run did not stop in time
        if (ShutdownManager::getInstance().onInterrupt() > 1) {
            std::_Exit(EXIT_FAILURE_CODE);
        }
    }
}
#endif

void installSignalHandlers() {
#ifdef _WIN32
    SetConsoleCtrlHandler(consoleHandler, TRUE);
#else
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#endif
}

void printUsage() {
    std::cout << "DeskPilot desktop automation runner\n";
    std::cout << "Usage: deskpilot [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  list                 List stored scripts\n";
    std::cout << "  templates            List stored template images\n";
    std::cout << "  run <scriptId>       Run a script until it ends\n";
    std::cout << "  show <scriptId>      Print the stored script document\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>      Configuration file (default config/deskpilot.json)\n";
    std::cout << "  --window <handle>    Target window for every script (decimal or 0x hex)\n";
    std::cout << "  --sample             Use in-memory storage holding the sample script\n";
    std::cout << "  --help, -h           Show this help message\n";
    std::cout << "  --version, -v        Show version information\n";
}

struct CommandLine {
    std::string configPath = "config/deskpilot.json";
    std::optional<WindowHandle> window;
    bool useSample = false;
    std::string command;
    std::vector<std::string> arguments;
};

// Returns an exit code when the process should end without running a command
std::optional<int> parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return EXIT_OK;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "deskpilot " << kVersion << "\n";
            return EXIT_OK;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config option requires a path argument\n";
                return EXIT_USAGE;
            }
            cmd.configPath = argv[++i];
        } else if (arg == "--window") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --window option requires a handle argument\n";
                return EXIT_USAGE;
            }
            cmd.window = parseWindowHandle(argv[++i]);
            if (!cmd.window) {
                std::cerr << "Error: invalid window handle '" << argv[i] << "'\n";
                return EXIT_USAGE;
            }
        } else if (arg == "--sample") {
            cmd.useSample = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            return EXIT_USAGE;
        } else if (cmd.command.empty()) {
            cmd.command = arg;
        } else {
            cmd.arguments.push_back(arg);
        }
    }

    if (cmd.command.empty()) {
        printUsage();
        return EXIT_USAGE;
    }
    return std::nullopt;
}

void configureLogging(const ConfigManager& config) {
    auto& logger = StructuredLogger::getInstance();
    logger.setLogLevel(parseLogLevel(config.getLogLevel()));

    std::shared_ptr<ILogFormatter> formatter;
    if (config.getLogFormat() == "json") {
        formatter = std::make_shared<JsonLogFormatter>();
    } else {
        formatter = std::make_shared<TextLogFormatter>();
    }

    if (!config.getLogFile().empty()) {
        RotatingFileLogSink::Config fileConfig;
        fileConfig.base_path = config.getLogFile();
        fileConfig.max_file_size = static_cast<size_t>(std::max(1, config.getLogMaxSizeMb())) * 1024 * 1024;
        fileConfig.max_files = static_cast<size_t>(std::max(1, config.getLogMaxFiles()));
        logger.addSink(std::make_shared<RotatingFileLogSink>(fileConfig, formatter));
    }

    logger.setAsyncLogging(config.getLogAsync());

    SLOG_DEBUG().message("Structured logging configured")
        .context("log_level", config.getLogLevel())
        .context("log_file", config.getLogFile())
        .context("async_logging", config.getLogAsync());
}

std::string repeatMode(const AutomationScript& script) {
    if (script.infiniteRepeat) {
        return "infinite";
    }
    return "x" + std::to_string(std::max(1, script.repeatCount));
}

int listScripts(IScriptStorage& storage) {
    auto scripts = storage.getAllScripts();
    if (scripts.empty()) {
        std::cout << "No scripts stored\n";
        return EXIT_OK;
    }
    for (const auto& script : scripts) {
        std::cout << std::left << std::setw(38) << script.id
                  << std::setw(32) << script.name
                  << std::setw(8) << (std::to_string(script.steps.size()) + " steps")
                  << "  " << repeatMode(script) << "\n";
    }
    return EXIT_OK;
}

int listTemplates(IScriptStorage& storage) {
    auto images = storage.getAllTemplateImages();
    if (images.empty()) {
        std::cout << "No template images stored\n";
        return EXIT_OK;
    }
    for (const auto& image : images) {
        std::cout << std::left << std::setw(38) << image.id
                  << std::setw(32) << image.name
                  << image.captureRegion.width << "x" << image.captureRegion.height
                  << "  threshold " << image.matchThreshold << "\n";
    }
    return EXIT_OK;
}

int showScript(IScriptStorage& storage, const std::string& scriptId) {
    auto script = storage.getScript(scriptId);
    if (!script) {
        std::cerr << "Script with ID " << scriptId << " not found\n";
        return EXIT_FAILURE_CODE;
    }
    std::cout << nlohmann::json(*script).dump(2) << "\n";
    return EXIT_OK;
}

int runScript(ScriptExecutionEngine& engine, const std::string& scriptId) {
    auto& shutdown = ShutdownManager::getInstance();

    auto listener = engine.events().subscribeLog([](const ExecutionLog& log) {
        std::cout << formatTimestamp(log.timestamp) << " [" << logLevelToString(log.level) << "] "
                  << log.message << std::endl;
    });

    try {
        engine.start(scriptId);
    } catch (const ScriptNotFoundException& e) {
        engine.events().unsubscribe(listener);
        std::cerr << e.what() << "\n";
        return EXIT_FAILURE_CODE;
    }

    bool stopRequested = false;
    while (!engine.waitForCompletion(scriptId, std::chrono::milliseconds(200))) {
        if (shutdown.isShutdownRequested() && !stopRequested) {
            SLOG_INFO().message("Shutdown signal received - press Ctrl+C again to force exit");
            engine.stop(scriptId);
            stopRequested = true;
        }
    }
    engine.events().unsubscribe(listener);

    auto state = engine.getExecutionState(scriptId);
    if (!state) {
        return EXIT_FAILURE_CODE;
    }

    std::cout << "Script finished: " << toString(state->status)
              << " after " << state->currentRepeat << " repeat(s)\n";
    return state->status == ExecutionStatus::ERROR_STATE ? EXIT_FAILURE_CODE : EXIT_OK;
}

int dispatch(const CommandLine& cmd) {
    auto& config = ConfigManager::getInstance();

    std::shared_ptr<IScriptStorage> storage;
    if (cmd.useSample) {
        auto memory = std::make_shared<InMemoryScriptStorage>();
        memory->seedSampleData();
        storage = memory;
    } else {
        storage = std::make_shared<FileScriptStorage>(config.getScriptsDirectory(), config.getTemplatesDirectory());
    }

    auto requireScriptId = [&cmd]() -> std::optional<std::string> {
        if (cmd.arguments.size() != 1) {
            std::cerr << "Error: " << cmd.command << " requires exactly one script id\n";
            return std::nullopt;
        }
        return cmd.arguments.front();
    };

    if (cmd.command == "list") {
        return listScripts(*storage);
    }
    if (cmd.command == "templates") {
        return listTemplates(*storage);
    }
    if (cmd.command == "show") {
        auto scriptId = requireScriptId();
        return scriptId ? showScript(*storage, *scriptId) : EXIT_USAGE;
    }
    if (cmd.command == "run") {
        auto scriptId = requireScriptId();
        if (!scriptId) {
            return EXIT_USAGE;
        }

        ScriptExecutionEngine engine(storage,
                                     std::make_shared<DesktopAutomationEngine>(),
                                     std::make_shared<DesktopScreenshotService>(config.getScreenshotsDirectory()),
                                     std::make_shared<TemplateMatcher>(),
                                     EngineOptions::fromConfig(config));
        if (cmd.window) {
            engine.overrideTargetWindow(cmd.window);
        }
        return runScript(engine, *scriptId);
    }

    std::cerr << "Error: unknown command " << cmd.command << "\n";
    printUsage();
    return EXIT_USAGE;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (auto exitCode = parseCommandLine(argc, argv, cmd)) {
        return *exitCode;
    }

    installSignalHandlers();

    int exitCode = EXIT_FAILURE_CODE;
    try {
        auto& config = ConfigManager::getInstance();
        config.loadConfig(cmd.configPath);
        configureLogging(config);

        SLOG_INFO().message("DeskPilot starting")
            .context("version", kVersion)
            .context("command", cmd.command)
            .context("config_path", cmd.configPath);

        exitCode = dispatch(cmd);
    } catch (const std::exception& e) {
        SLOG_ERROR().message("Fatal error").context("error", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        exitCode = EXIT_FAILURE_CODE;
    }

    SLOG_DEBUG().message("DeskPilot shutting down").context("exit_code", exitCode);
    StructuredLogger::getInstance().flush();
    StructuredLogger::getInstance().shutdown();
    return exitCode;
}
