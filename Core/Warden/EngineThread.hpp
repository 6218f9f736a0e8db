#pragma once

// EngineThread.hpp - фоновый поток движка для Start/Stop/IsRunning:
// код завершения сохраняется, поток всегда join-ится (Wait() или деструктор).

#include <atomic>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

class EngineThread
{
public:
    using Body = std::function<int(std::stop_token)>;

    EngineThread() = default;
    ~EngineThread();

    EngineThread(const EngineThread&)            = delete;
    EngineThread& operator=(const EngineThread&) = delete;

    /**
     * @brief Запустить body в новом потоке. Завершившийся предыдущий поток join-ится.
     * @return false, если движок ещё работает.
     */
    bool Start(Body body);

    // Запросить остановку, не блокируя вызывающего. false - не запущен.
    bool RequestStop();

    /**
     * @brief Дождаться завершения и вернуть код body.
     * Исключение из body даёт код 1. Без запуска возвращает последний код.
     */
    int Wait();

    bool IsRunning() const;

private:
    void Join_();

    std::mutex        join_mu_;  // thread_
    std::mutex        stop_mu_;  // stop_; не держится во время join
    std::thread       thread_;
    std::stop_source  stop_;
    std::atomic<bool> running_ { false };
    std::atomic<int>  result_  { 0 };
};
