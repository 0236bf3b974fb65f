#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config/ConfigLoader.hpp"
#include "core/BackupEngine.hpp"
#include "core/BackupError.hpp"
#include "core/Clock.hpp"
#include "core/JobScheduler.hpp"
#include "utils/ConsoleLogger.hpp"
#include "utils/FileLogger.hpp"

namespace {

const int EXIT_USAGE = 1;
const int EXIT_STARTUP = 2;

volatile std::sig_atomic_t g_running = 1;

void handleSignal(int) {
    g_running = 0;
}

void printUsage(std::ostream& out) {
    out << "Usage: snapshotd [--config PATH] [--once] [--help]\n"
        << "  -c, --config PATH  configuration file (default: $CONFIG_PATH or config.yml)\n"
        << "      --once         run every job once and exit\n"
        << "  -h, --help         show this help\n"
        << "Environment: CONFIG_PATH, LOG_LEVEL (DEBUG, INFO, WARNING, ERROR)\n";
}

struct Options {
    std::string configPath;
    bool once = false;
    bool help = false;
};

bool parseArguments(int argc, char** argv, Options& options) {
    const char* envPath = std::getenv("CONFIG_PATH");
    options.configPath = envPath != nullptr && *envPath != '\0' ? envPath : "config.yml";

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            options.configPath = argv[++i];
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

// 配置文件中的级别优先级低于LOG_LEVEL环境变量
LogLevel resolveLogLevel(const std::string& configured, ILogger* logger) {
    LogLevel level = LogLevel::INFO;
    if (!configured.empty() && !parseLogLevel(configured, level)) {
        logger->warn("Unknown log_level '" + configured + "', using INFO");
    }
    const char* env = std::getenv("LOG_LEVEL");
    if (env != nullptr && *env != '\0' && !parseLogLevel(env, level)) {
        logger->warn(std::string("Unknown LOG_LEVEL '") + env + "' ignored");
    }
    return level;
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(std::cerr);
        return EXIT_USAGE;
    }
    if (options.help) {
        printUsage(std::cout);
        return 0;
    }

    // 加载配置前先输出到控制台
    auto consoleLogger = std::make_unique<ConsoleLogger>();
    consoleLogger->setLogLevel(resolveLogLevel("", consoleLogger.get()));

    DaemonConfig config;
    try {
        config = ConfigLoader::loadFromYaml(options.configPath, consoleLogger.get());
    } catch (const BackupError& e) {
        consoleLogger->error(toString(e.getKind()) + ": " + e.what());
        return EXIT_STARTUP;
    }

    std::unique_ptr<ILogger> logger;
    if (!config.logFile.empty()) {
        auto fileLogger = std::make_unique<FileLogger>(config.logFile);
        std::string errorMessage;
        if (!fileLogger->open(errorMessage)) {
            consoleLogger->error("Cannot open log file " + config.logFile + ": " + errorMessage);
            return EXIT_STARTUP;
        }
        consoleLogger->info("Logging to " + config.logFile);
        logger = std::move(fileLogger);
    } else {
        logger = std::move(consoleLogger);
    }
    logger->setLogLevel(resolveLogLevel(config.logLevel, logger.get()));
    if (config.rejectedJobs > 0) {
        logger->warn(std::to_string(config.rejectedJobs) + " job(s) rejected by configuration");
    }

    auto clock = std::make_shared<SystemClock>();
    BackupEngine engine(logger.get(), clock);
    for (const auto& job : config.jobs) {
        engine.removeStaleTemporaries(job);
    }

    if (options.once) {
        // 单次模式：依次运行每个任务，失败已记录在日志中
        for (const auto& job : config.jobs) {
            engine.run(job);
        }
        return 0;
    }

    JobScheduler scheduler(logger.get(), clock, [&engine](const Job& job) {
        engine.run(job);
    });
    try {
        for (const auto& job : config.jobs) {
            scheduler.addJob(job);
        }
    } catch (const BackupError& e) {
        logger->error(toString(e.getKind()) + ": " + e.what());
        return EXIT_STARTUP;
    }

    // 先注册信号处理，再启动调度器
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!scheduler.start()) {
        return EXIT_STARTUP;
    }
    logger->info("snapshotd started with " + std::to_string(config.jobs.size()) + " jobs");

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    logger->info("Shutting down snapshotd");
    scheduler.stop();
    return 0;
}
