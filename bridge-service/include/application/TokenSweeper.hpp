#pragma once

#include "ports/input/IHandoffTokenService.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/IClock.hpp"
#include "settings/BridgeSettings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace bridge::application {

/**
 * @brief Фоновая очистка просроченных токенов и сессий
 *
 * Запускается приложением после связывания зависимостей, останавливается
 * в stop()/деструкторе. stop() будит спящий поток сразу, не дожидаясь
 * окончания интервала.
 */
class TokenSweeper {
public:
    TokenSweeper(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<ports::input::IHandoffTokenService> tokenService,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<ports::output::IClock> clock
    ) : interval_(settings->getSweepInterval())
      , tokenService_(std::move(tokenService))
      , sessionRepo_(std::move(sessionRepo))
      , clock_(std::move(clock))
      , running_(false)
      , tickCount_(0)
    {}

    ~TokenSweeper() {
        stop();
    }

    TokenSweeper(const TokenSweeper&) = delete;
    TokenSweeper& operator=(const TokenSweeper&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        std::cout << "[TokenSweeper] Started (interval=" << interval_.count() << "ms)" << std::endl;

        thread_ = std::thread([this]() {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                if (cv_.wait_for(lock, interval_, [this]() { return !running_; })) {
                    break;
                }
                lock.unlock();
                doTick();
                lock.lock();
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[TokenSweeper] Stopped" << std::endl;
    }

    bool isRunning() const { return running_; }

    uint64_t tickCount() const { return tickCount_; }

    /**
     * @brief Выполнить один проход вручную (для тестов)
     */
    void manualTick() {
        doTick();
    }

private:
    std::chrono::milliseconds interval_;
    std::shared_ptr<ports::input::IHandoffTokenService> tokenService_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void doTick() {
        size_t tokens = tokenService_->sweep();

        size_t sessions = 0;
        try {
            sessions = sessionRepo_->deleteExpired(clock_->now());
        } catch (const ports::output::SessionPersistenceError& e) {
            // Следующий проход повторит очистку
            std::cerr << "[TokenSweeper] Session sweep failed: " << e.what() << std::endl;
        }

        if (tokens > 0 || sessions > 0) {
            std::cout << "[TokenSweeper] Removed " << tokens << " token(s), "
                      << sessions << " session(s)" << std::endl;
        }
        ++tickCount_;
    }
};

} // namespace bridge::application
