#include "ConfigLoader.hpp"
#include "../core/BackupError.hpp"
#include "../utils/ILogger.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace {

const char* const DEFAULT_FORMAT = "Y-m-d_H-M-S-f";

const std::set<std::string> TOP_LEVEL_KEYS = {"format", "fingerprint", "log_file", "log_level", "sources"};
const std::set<std::string> SOURCE_KEYS = {"source", "target", "period", "method", "compress", "limit",
                                           "format", "fingerprint", "name"};

void warnUnknownKeys(const YAML::Node& node, const std::set<std::string>& known,
                     const std::string& where, ILogger* logger) {
    for (const auto& item : node) {
        std::string key = item.first.as<std::string>();
        if (known.count(key) == 0) {
            logger->warn("Unknown key '" + key + "' in " + where + " ignored");
        }
    }
}

std::string requireString(const YAML::Node& node, const std::string& key) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar() || value.Scalar().empty()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "missing or empty '" + key + "'");
    }
    return value.Scalar();
}

} // namespace

std::chrono::milliseconds ConfigLoader::parsePeriod(const std::string& text) {
    size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        digits++;
    }
    if (digits == 0 || digits > 12) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "invalid period '" + text + "'");
    }

    long long value = std::stoll(text.substr(0, digits));
    std::string unit = text.substr(digits);
    long long unitMs = 0;
    if (unit.empty() || unit == "s") {
        unitMs = 1000;
    } else if (unit == "ms") {
        unitMs = 1;
    } else if (unit == "m") {
        unitMs = 60 * 1000;
    } else if (unit == "h") {
        unitMs = 60 * 60 * 1000;
    } else if (unit == "d") {
        unitMs = 24 * 60 * 60 * 1000;
    } else {
        throw BackupError(ErrorKind::INVALID_CONFIG, "invalid period unit in '" + text + "'");
    }
    // 周期要与系统时钟的时间点相加，留出一半范围给当前时间
    const long long maxPeriodMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::duration::max()).count() / 2;
    if (value > maxPeriodMs / unitMs) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "period too large: '" + text + "'");
    }
    std::chrono::milliseconds period(value * unitMs);

    if (period.count() <= 0) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "period must be positive: '" + text + "'");
    }
    return period;
}

DaemonConfig ConfigLoader::loadFromYaml(const std::string& path, ILogger* logger) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "failed to load config " + path + ": " + e.what());
    }
    logger->info("Loaded configuration from " + path);
    return loadFromNode(root, logger);
}

DaemonConfig ConfigLoader::loadFromNode(const YAML::Node& root, ILogger* logger) {
    if (!root.IsMap()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "config root must be a mapping");
    }
    DaemonConfig config;
    std::string defaultFormat = DEFAULT_FORMAT;
    FingerprintMode defaultFingerprint = FingerprintMode::METADATA;
    try {
        warnUnknownKeys(root, TOP_LEVEL_KEYS, "config", logger);
        if (root["format"]) {
            defaultFormat = root["format"].as<std::string>();
        }
        if (root["fingerprint"] && !parseFingerprintMode(root["fingerprint"].as<std::string>(), defaultFingerprint)) {
            throw BackupError(ErrorKind::INVALID_CONFIG,
                              "unknown fingerprint '" + root["fingerprint"].as<std::string>() + "'");
        }
        if (root["log_file"]) {
            config.logFile = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            config.logLevel = root["log_level"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw BackupError(ErrorKind::INVALID_CONFIG, std::string("invalid top-level value: ") + e.what());
    }

    const YAML::Node sources = root["sources"];
    if (!sources || !sources.IsSequence()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "'sources' must be a sequence");
    }

    std::set<std::string> ids;
    for (size_t i = 0; i < sources.size(); i++) {
        try {
            Job job = parseJob(sources[i], defaultFormat, defaultFingerprint, logger);
            if (!ids.insert(job.id).second) {
                throw BackupError(ErrorKind::INVALID_CONFIG, "duplicate job id " + job.id);
            }
            logger->info("Job " + job.describe());
            config.jobs.push_back(job);
        } catch (const BackupError& e) {
            config.rejectedJobs++;
            logger->error("Skipping sources[" + std::to_string(i) + "]: " + toString(e.getKind()) + ": " + e.what());
        }
    }

    if (config.jobs.empty()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "no valid job in config");
    }
    return config;
}

Job ConfigLoader::parseJob(const YAML::Node& node, const std::string& defaultFormat,
                           FingerprintMode defaultFingerprint, ILogger* logger) {
    if (!node.IsMap()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "entry must be a mapping");
    }

    Job job;
    try {
        warnUnknownKeys(node, SOURCE_KEYS, "source entry", logger);

        job.sourcePath = requireString(node, "source");
        std::string target = requireString(node, "target");
        job.period = parsePeriod(requireString(node, "period"));

        if (node["method"] && !parseBackupMethod(node["method"].as<std::string>(), job.method)) {
            throw BackupError(ErrorKind::INVALID_CONFIG, "unknown method '" + node["method"].as<std::string>() + "'");
        }
        if (node["compress"]) {
            job.compress = node["compress"].as<bool>();
        }
        if (node["limit"] && !node["limit"].IsNull()) {
            long long limit = node["limit"].as<long long>();
            if (limit <= 0) {
                throw BackupError(ErrorKind::INVALID_CONFIG, "limit must be a positive integer");
            }
            job.limit = static_cast<size_t>(limit);
        }
        job.nameFormat = node["format"] ? node["format"].as<std::string>() : defaultFormat;
        job.fingerprint = defaultFingerprint;
        if (node["fingerprint"] && !parseFingerprintMode(node["fingerprint"].as<std::string>(), job.fingerprint)) {
            throw BackupError(ErrorKind::INVALID_CONFIG,
                              "unknown fingerprint '" + node["fingerprint"].as<std::string>() + "'");
        }

        job.id = node["name"] ? node["name"].as<std::string>() : Job::idFromSource(job.sourcePath);
        if (job.id.empty() || job.id == "." || job.id == ".." || job.id.find('/') != std::string::npos) {
            throw BackupError(ErrorKind::INVALID_CONFIG, "invalid job name '" + job.id + "'");
        }
        job.targetPath = (fs::path(target) / job.id).string();
    } catch (const YAML::Exception& e) {
        throw BackupError(ErrorKind::INVALID_CONFIG, e.what());
    }

    if (job.limit && job.method != BackupMethod::DIFF) {
        logger->warn("Job " + job.id + ": limit is ignored for method " + toString(job.method));
        job.limit.reset();
    }

    job.validate();
    return job;
}
