#include "agrocache/core/cache/eviction/ExpirySweeper.hpp"
#include "agrocache/core/logging/Logger.hpp"
#include <sstream>

namespace agrocache {
namespace core {
namespace cache {

ExpirySweeper::ExpirySweeper(std::chrono::milliseconds interval, SweepTask task)
    : interval_(interval), task_(std::move(task)) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    if (interval_.count() <= 0) {
        logging::get()->info("ExpirySweeper: интервал 0, фоновая очистка отключена");
        return;
    }

    stopRequested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this] { threadFunc(); });
    logging::get()->debug("ExpirySweeper: фоновый поток запущен с интервалом {} мс", interval_.count());
}

void ExpirySweeper::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    stopRequested_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        cv_.notify_all();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
    logging::get()->debug("ExpirySweeper: фоновый поток завершён, проходов={}, ошибок={}",
                          completedRuns(), failedRuns());
}

size_t ExpirySweeper::runOnce() {
    try {
        size_t removed = task_ ? task_() : 0;
        completedRuns_.fetch_add(1, std::memory_order_relaxed);
        if (removed > 0) {
            logging::get()->info("ExpirySweeper: удалено истёкших записей: {}", removed);
        }
        return removed;
    } catch (const std::exception& e) {
        // Повтор на следующем интервале
        failedRuns_.fetch_add(1, std::memory_order_relaxed);
        logging::get()->error("ExpirySweeper: ошибка очистки: {}", e.what());
        return 0;
    }
}

bool ExpirySweeper::isRunning() const {
    return running_.load(std::memory_order_acquire);
}

void ExpirySweeper::threadFunc() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    logging::get()->debug("ExpirySweeper: поток стартует (thread_id={})", oss.str());

    while (!stopRequested_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(waitMutex_);
            cv_.wait_for(lock, interval_,
                         [this] { return stopRequested_.load(std::memory_order_acquire); });
        }
        if (stopRequested_.load(std::memory_order_acquire)) break;
        runOnce();
    }

    logging::get()->debug("ExpirySweeper: поток завершён (thread_id={})", oss.str());
}

} // namespace cache
} // namespace core
} // namespace agrocache
