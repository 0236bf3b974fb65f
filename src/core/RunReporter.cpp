#include "RunReporter.hpp"
#include "models/Job.hpp"
#include "../utils/ILogger.hpp"
#include <sstream>

namespace {

// 含空白、引号、换行或为空的值加引号，保证一个事件只占一行
std::string quoteValue(const std::string& value) {
    if (!value.empty() && value.find_first_of(" \"=\t\n\r\\") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '\n') {
            quoted += "\\n";
        } else if (c == '\r') {
            quoted += "\\r";
        } else {
            if (c == '"' || c == '\\') {
                quoted += '\\';
            }
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) {
            joined += ",";
        }
        joined += names[i];
    }
    return joined;
}

} // namespace

RunReporter::RunReporter(ILogger* logger) : logger(logger) {}

std::string RunReporter::formatEvent(const std::string& event, const Fields& fields) {
    std::ostringstream out;
    out << "event=" << event;
    for (const auto& field : fields) {
        out << ' ' << field.first << '=' << quoteValue(field.second);
    }
    return out.str();
}

void RunReporter::runStarted(const Job& job) {
    logger->info(formatEvent("run_started", {
        {"job", job.id},
        {"method", toString(job.method)},
        {"source", job.sourcePath},
    }));
}

void RunReporter::runCompleted(const Job& job, const std::string& snapshotName,
                               size_t added, size_t modified, size_t removed, size_t skipped) {
    logger->info(formatEvent("run_completed", {
        {"job", job.id},
        {"snapshot", snapshotName},
        {"added", std::to_string(added)},
        {"modified", std::to_string(modified)},
        {"removed", std::to_string(removed)},
        {"skipped", std::to_string(skipped)},
    }));
}

void RunReporter::runSkipped(const Job& job, size_t skipped) {
    logger->info(formatEvent("run_skipped", {
        {"job", job.id},
        {"reason", "no changes"},
        {"skipped", std::to_string(skipped)},
    }));
}

void RunReporter::runFailed(const Job& job, ErrorKind kind, const std::string& message) {
    logger->error(formatEvent("run_failed", {
        {"job", job.id},
        {"error", toString(kind)},
        {"message", message},
    }));
}

void RunReporter::pruned(const Job& job, const std::vector<std::string>& removedNames) {
    if (removedNames.empty()) {
        return;
    }
    logger->info(formatEvent("pruned", {
        {"job", job.id},
        {"count", std::to_string(removedNames.size())},
        {"removed", joinNames(removedNames)},
    }));
}

void RunReporter::pruneFailed(const Job& job, const std::string& snapshotName, const std::string& message) {
    logger->error(formatEvent("prune_failed", {
        {"job", job.id},
        {"error", toString(ErrorKind::PRUNE_ERROR)},
        {"snapshot", snapshotName},
        {"message", message},
    }));
}

void RunReporter::tickDropped(const Job& job) {
    logger->warn(formatEvent("tick_dropped", {
        {"job", job.id},
        {"reason", "previous run still in progress"},
    }));
}

void RunReporter::fileSkipped(const Job& job, const std::string& path, const std::string& reason) {
    logger->warn(formatEvent("file_skipped", {
        {"job", job.id},
        {"path", path},
        {"reason", reason},
    }));
}
