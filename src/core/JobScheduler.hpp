#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include "Clock.hpp"
#include "RunReporter.hpp"
#include "Types.hpp"
#include "models/Job.hpp"

class ILogger;

// 每个任务一个独立的定时器：
//   到期且任务空闲 -> 转为RUNNING，在该任务自己的工作线程上执行一次运行，结束后回到IDLE
//   到期但任务仍在运行 -> 丢弃本次触发并记录，不排队
// 不同任务之间互不阻塞。
class JobScheduler {
public:
    using Runner = std::function<void(const Job&)>;

private:
    struct JobSlot {
        Job job;
        JobState state = JobState::IDLE;
        bool scheduled = false;    // 尚未触发过，下一次tick立即运行
        std::chrono::system_clock::time_point nextDue;
        size_t runs = 0;
        size_t dropped = 0;
        std::thread worker;
    };

    ILogger* logger;
    std::shared_ptr<IClock> clock;
    Runner runner;
    RunReporter reporter;

    std::map<std::string, std::unique_ptr<JobSlot>> slots;

    std::thread timerThread;
    std::atomic<bool> running;
    bool stopping;
    mutable std::mutex mutex;
    std::condition_variable timerCv;
    std::condition_variable idleCv;

    void tickLocked();
    void launch(JobSlot& slot);
    void executeRun(JobSlot* slot);
    bool allIdleLocked() const;
    const JobSlot& slotFor(const std::string& jobId) const;

    // 定时器线程函数
    void timerThreadFunc();

protected:
    // 为一次运行创建工作线程，失败时抛出 std::system_error
    virtual std::thread startWorker(std::function<void()> body);

public:
    JobScheduler(ILogger* logger, std::shared_ptr<IClock> clock, Runner runner);
    virtual ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // 任务id重复或调度器已启动时抛出 BackupError(INVALID_CONFIG)
    void addJob(const Job& job);

    // 启动定时器线程，每个任务的第一次运行立即触发
    bool start();

    // 不再触发新的运行，等待进行中的运行结束
    void stop();

    // 按当前时钟检查所有任务的定时器；测试中配合手动时钟直接调用
    void tick();

    // 阻塞直到所有任务都处于IDLE
    void waitForIdle();

    bool isRunning() const;
    size_t getJobCount() const;

    // 以下查询对未知的任务id抛出 std::out_of_range
    JobState getState(const std::string& jobId) const;
    size_t getRunCount(const std::string& jobId) const;
    size_t getDroppedTicks(const std::string& jobId) const;
};
