#pragma once

#include "ports/output/ISessionRepository.hpp"
#include "ports/output/IClock.hpp"
#include <memory>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <vector>
#include <utility>

namespace bridge::adapters::secondary {

/**
 * @brief Хранилище сессий в памяти процесса
 *
 * Отдельное пространство на каждый CookieScope (имя cookie + домен).
 * Запись с истёкшим max-age считается отсутствующей и удаляется при чтении.
 */
class InMemorySessionRepository : public ports::output::ISessionRepository {
public:
    explicit InMemorySessionRepository(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock)) {}

    void save(const domain::Session& session) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        scopes_[keyOf(session.scope)][session.sessionId] = session;
    }

    bool update(const domain::Session& session) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto scopeIt = scopes_.find(keyOf(session.scope));
        if (scopeIt == scopes_.end()) return false;
        auto it = scopeIt->second.find(session.sessionId);
        if (it == scopeIt->second.end()) return false;
        it->second = session;
        return true;
    }

    std::optional<domain::Session> findById(
        const domain::CookieScope& scope,
        const std::string& sessionId
    ) override {
        auto now = clock_->now();
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto* session = lookup(scope, sessionId);
            if (!session) return std::nullopt;
            if (!session->isExpiredAt(now)) return *session;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto* session = lookup(scope, sessionId);
        if (session && session->isExpiredAt(now)) {
            scopes_[keyOf(scope)].erase(sessionId);
        }
        return std::nullopt;
    }

    bool deleteById(const domain::CookieScope& scope, const std::string& sessionId) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = scopes_.find(keyOf(scope));
        if (it == scopes_.end()) return false;
        return it->second.erase(sessionId) > 0;
    }

    size_t deleteExpired(std::chrono::system_clock::time_point now) override {
        std::vector<std::pair<std::string, std::string>> candidates;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            for (const auto& [scopeKey, sessions] : scopes_) {
                for (const auto& [id, session] : sessions) {
                    if (session.isExpiredAt(now)) {
                        candidates.emplace_back(scopeKey, id);
                    }
                }
            }
        }

        size_t removed = 0;
        for (const auto& [scopeKey, id] : candidates) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto scopeIt = scopes_.find(scopeKey);
            if (scopeIt == scopes_.end()) continue;
            auto it = scopeIt->second.find(id);
            if (it != scopeIt->second.end() && it->second.isExpiredAt(now)) {
                scopeIt->second.erase(it);
                ++removed;
            }
        }
        return removed;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& [key, sessions] : scopes_) {
            total += sessions.size();
        }
        return total;
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unordered_map<std::string, domain::Session>> scopes_;

    static std::string keyOf(const domain::CookieScope& scope) {
        return scope.cookieName + "@" + scope.cookieDomain;
    }

    const domain::Session* lookup(const domain::CookieScope& scope, const std::string& sessionId) const {
        auto scopeIt = scopes_.find(keyOf(scope));
        if (scopeIt == scopes_.end()) return nullptr;
        auto it = scopeIt->second.find(sessionId);
        return it == scopeIt->second.end() ? nullptr : &it->second;
    }
};

} // namespace bridge::adapters::secondary
