#include "core/thread/ThreadPool.hpp"
#include "core/logging/Logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace homebook {
namespace core {
namespace thread {

// Реализация PIMPL
struct ThreadPool::Impl {
    std::vector<std::thread> workers;           // Рабочие потоки
    std::queue<std::function<void()>> tasks;    // Очередь задач
    mutable std::mutex queueMutex;              // Мьютекс для очереди
    std::condition_variable condition;          // Появилась задача / остановка
    std::condition_variable idle;               // Очередь опустела и нет активных задач
    bool stop;                                  // Флаг остановки (под queueMutex)
    std::atomic<size_t> activeThreads;          // Количество активных потоков
    std::atomic<size_t> completedTasks;         // Выполнено задач
    ThreadPoolConfig config;                    // Конфигурация пула потоков
    std::shared_ptr<spdlog::logger> logger;

    Impl(const ThreadPoolConfig& cfg)
        : stop(false), activeThreads(0), completedTasks(0), config(cfg)
        , logger(logging::getLogger(cfg.loggerName)) {
        startWorkers();
    }

    ~Impl() {
        shutdownWorkers();
    }

    size_t targetThreadCount() const {
        size_t hw = std::thread::hardware_concurrency();
        if (hw == 0) hw = config.minThreads;
        return std::max(config.minThreads, std::min(config.maxThreads, hw));
    }

    void startWorkers() {
        size_t threadCount = targetThreadCount();
        for (size_t i = 0; i < threadCount; ++i) {
            workers.emplace_back([this] {
                processTasks();
            });
        }
        logger->debug("Thread pool started: {} threads", workers.size());
    }

    void shutdownWorkers() {
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            stop = true;
        }
        condition.notify_all();

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers.clear();
    }

    void processTasks() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                condition.wait(lock, [this] {
                    return stop || !tasks.empty();
                });

                if (stop && tasks.empty()) {
                    return;
                }

                task = std::move(tasks.front());
                tasks.pop();
                ++activeThreads;
            }

            try {
                task();
            } catch (const std::exception& e) {
                logger->error("Task failed: {}", e.what());
            }

            {
                std::unique_lock<std::mutex> lock(queueMutex);
                --activeThreads;
                ++completedTasks;
                if (tasks.empty() && activeThreads.load() == 0) {
                    idle.notify_all();
                }
            }
        }
    }
};

// Конструктор
ThreadPool::ThreadPool(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid thread pool configuration");
    }
    pImpl = std::make_unique<Impl>(config);
}

// Деструктор
ThreadPool::~ThreadPool() = default;

// Добавление задачи в очередь
void ThreadPool::enqueue(std::function<void()> task) {
    if (!task) return;

    {
        std::unique_lock<std::mutex> lock(pImpl->queueMutex);

        if (pImpl->stop) {
            throw std::runtime_error("Thread pool is stopped");
        }
        // Проверка размера очереди
        if (pImpl->tasks.size() >= pImpl->config.queueSize) {
            pImpl->logger->error("Task queue overflow: {} pending", pImpl->tasks.size());
            throw std::runtime_error("Task queue is full");
        }

        pImpl->tasks.push(std::move(task));
    }
    pImpl->condition.notify_one();
}

// Получение количества активных потоков
size_t ThreadPool::getActiveThreadCount() const {
    return pImpl->activeThreads.load();
}

// Получение размера очереди
size_t ThreadPool::getQueueSize() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

// Проверка пустоты очереди
bool ThreadPool::isQueueEmpty() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.empty();
}

// Ожидание завершения всех задач
void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->idle.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->activeThreads.load() == 0;
    });
}

// Остановка пула потоков
void ThreadPool::stop() {
    pImpl->shutdownWorkers();
    pImpl->logger->debug("Thread pool stopped");
}

// Перезапуск пула потоков
void ThreadPool::restart() {
    pImpl->shutdownWorkers();
    {
        std::unique_lock<std::mutex> lock(pImpl->queueMutex);
        pImpl->stop = false;
    }
    pImpl->startWorkers();
    pImpl->logger->debug("Thread pool restarted");
}

bool ThreadPool::isStopped() const {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    return pImpl->stop;
}

// Получение метрик
ThreadPoolMetrics ThreadPool::getMetrics() const {
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeThreads.load();
    metrics.queueSize = getQueueSize();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks.load();
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace homebook
