#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <type_traits>
#include <string>

namespace homebook {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads;    // Количество активных потоков
    size_t queueSize;        // Размер очереди задач
    size_t totalThreads;     // Общее количество потоков
    size_t completedTasks;   // Выполнено задач
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t minThreads = 1;      // Минимальное количество потоков
    size_t maxThreads = 4;      // Максимальное количество потоков
    size_t queueSize = 1024;    // Максимальный размер очереди
    std::string loggerName = "threadpool";

    bool validate() const {
        if (minThreads > maxThreads) return false;
        if (minThreads == 0) return false;
        if (queueSize == 0) return false;
        return true;
    }
};

// Пул потоков для файлового ввода-вывода и асинхронных генераций
class ThreadPool {
public:
    // Конструктор с конфигурацией
    explicit ThreadPool(const ThreadPoolConfig& config);

    // Деструктор
    ~ThreadPool();

    // Запрет копирования
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавление задачи в очередь (std::runtime_error при переполнении или остановке)
    void enqueue(std::function<void()> task);

    /**
     * @brief Поставить задачу в очередь и получить future на её результат.
     * @details Исключение задачи доставляется через future.
     */
    template<typename F>
    auto submit(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
        std::future<Result> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    // Получение количества активных потоков
    size_t getActiveThreadCount() const;

    // Получение размера очереди
    size_t getQueueSize() const;

    // Проверка пустоты очереди
    bool isQueueEmpty() const;

    // Ожидание завершения всех задач
    void waitForCompletion();

    // Остановка пула потоков (оставшиеся задачи выполняются)
    void stop();

    // Перезапуск пула потоков
    void restart();

    bool isStopped() const;

    // Получение метрик
    ThreadPoolMetrics getMetrics() const;

    // Получение текущей конфигурации
    ThreadPoolConfig getConfiguration() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace core
} // namespace homebook
