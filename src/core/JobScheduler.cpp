#include "JobScheduler.hpp"
#include "BackupError.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

// 定时器线程最长等待时间，保证时钟被调整后能及时发现
const std::chrono::seconds MAX_WAIT(1);

} // namespace

JobScheduler::JobScheduler(ILogger* logger, std::shared_ptr<IClock> clock, Runner runner)
    : logger(logger), clock(std::move(clock)), runner(std::move(runner)), reporter(logger),
      running(false), stopping(false) {}

JobScheduler::~JobScheduler() {
    stop();
}

void JobScheduler::addJob(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex);
    if (running) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "cannot add job " + job.id + " to a running scheduler");
    }
    if (slots.count(job.id) > 0) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "duplicate job id " + job.id);
    }
    auto slot = std::make_unique<JobSlot>();
    slot->job = job;
    slots.emplace(job.id, std::move(slot));
}

bool JobScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex);
    if (running) {
        logger->error("Scheduler is already running.");
        return false;
    }
    if (slots.empty()) {
        logger->error("Scheduler has no jobs to run.");
        return false;
    }
    stopping = false;
    running = true;
    timerThread = std::thread(&JobScheduler::timerThreadFunc, this);
    logger->info("Scheduler started with " + std::to_string(slots.size()) + " jobs");
    return true;
}

void JobScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
        running = false;
    }
    timerCv.notify_all();
    if (timerThread.joinable()) {
        timerThread.join();
    }

    // stopping之后不会再启动新的工作线程，这里可以不加锁遍历
    bool waited = false;
    for (auto& entry : slots) {
        if (entry.second->worker.joinable()) {
            if (!waited) {
                logger->info("Waiting for running backups to finish...");
                waited = true;
            }
            entry.second->worker.join();
        }
    }
    if (waited) {
        logger->info("Scheduler stopped.");
    }
}

void JobScheduler::tick() {
    std::lock_guard<std::mutex> lock(mutex);
    tickLocked();
}

void JobScheduler::tickLocked() {
    if (stopping) {
        return;
    }
    auto now = clock->now();
    for (auto& entry : slots) {
        JobSlot& slot = *entry.second;
        if (slot.scheduled) {
            // 时钟回拨后不能等待超过一个周期
            if (slot.nextDue > now + slot.job.period) {
                slot.nextDue = now + slot.job.period;
            }
            if (now < slot.nextDue) {
                continue;
            }
        }

        // 错过多个周期（休眠、挂起）也只补一次
        slot.scheduled = true;
        slot.nextDue = now + slot.job.period;

        if (slot.state == JobState::RUNNING) {
            slot.dropped++;
            reporter.tickDropped(slot.job);
            continue;
        }
        launch(slot);
    }
}

void JobScheduler::launch(JobSlot& slot) {
    // 上一次的工作线程已经把状态置回IDLE，只剩退出
    if (slot.worker.joinable()) {
        slot.worker.join();
    }
    slot.state = JobState::RUNNING;
    try {
        slot.worker = startWorker([this, &slot] { executeRun(&slot); });
    } catch (const std::system_error& e) {
        // 只影响本任务，下一个周期再试
        slot.state = JobState::IDLE;
        logger->error("Cannot start run for job " + slot.job.id + ": " + e.what());
        return;
    }
    slot.runs++;
}

std::thread JobScheduler::startWorker(std::function<void()> body) {
    return std::thread(std::move(body));
}

void JobScheduler::executeRun(JobSlot* slot) {
    try {
        runner(slot->job);
    } catch (const std::exception& e) {
        logger->error("Job " + slot->job.id + " failed unexpectedly: " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        slot->state = JobState::IDLE;
    }
    idleCv.notify_all();
}

void JobScheduler::timerThreadFunc() {
    std::unique_lock<std::mutex> lock(mutex);
    while (running) {
        tickLocked();

        auto now = clock->now();
        auto wakeAt = now + MAX_WAIT;
        for (const auto& entry : slots) {
            wakeAt = std::min(wakeAt, entry.second->nextDue);
        }
        auto delay = std::max(std::chrono::system_clock::duration::zero(), wakeAt - now);
        timerCv.wait_for(lock, delay, [this] { return !running; });
    }
}

bool JobScheduler::allIdleLocked() const {
    return std::all_of(slots.begin(), slots.end(), [](const auto& entry) {
        return entry.second->state == JobState::IDLE;
    });
}

void JobScheduler::waitForIdle() {
    std::unique_lock<std::mutex> lock(mutex);
    idleCv.wait(lock, [this] { return allIdleLocked(); });
}

bool JobScheduler::isRunning() const {
    return running;
}

size_t JobScheduler::getJobCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return slots.size();
}

const JobScheduler::JobSlot& JobScheduler::slotFor(const std::string& jobId) const {
    auto it = slots.find(jobId);
    if (it == slots.end()) {
        throw std::out_of_range("unknown job " + jobId);
    }
    return *it->second;
}

JobState JobScheduler::getState(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex);
    return slotFor(jobId).state;
}

size_t JobScheduler::getRunCount(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex);
    return slotFor(jobId).runs;
}

size_t JobScheduler::getDroppedTicks(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex);
    return slotFor(jobId).dropped;
}
