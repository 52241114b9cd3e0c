#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace agrocache {
namespace core {
namespace cache {

// ExpirySweeper: фоновый поток периодической очистки истёкших записей.
// stop() будит поток и дожидается его завершения.
class ExpirySweeper {
public:
    using SweepTask = std::function<size_t()>; // Возвращает число удалённых записей

    ExpirySweeper(std::chrono::milliseconds interval, SweepTask task);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void start();            // Запуск потока (повторный вызов игнорируется)
    void stop();             // Сигнал остановки + join
    size_t runOnce();        // Синхронный проход; исключения логируются
    bool isRunning() const;
    std::chrono::milliseconds interval() const { return interval_; }
    uint64_t completedRuns() const { return completedRuns_.load(std::memory_order_relaxed); }
    uint64_t failedRuns() const { return failedRuns_.load(std::memory_order_relaxed); }

private:
    void threadFunc();

    std::chrono::milliseconds interval_;
    SweepTask task_;
    std::thread thread_;
    std::mutex waitMutex_;   // Только для ожидания на cv_
    std::mutex lifecycleMutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> completedRuns_{0};
    std::atomic<uint64_t> failedRuns_{0};
};

} // namespace cache
} // namespace core
} // namespace agrocache
