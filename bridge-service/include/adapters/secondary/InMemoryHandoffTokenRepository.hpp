#pragma once

#include "ports/output/IHandoffTokenRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace bridge::adapters::secondary {

/**
 * @brief Хранилище токенов передачи в памяти процесса
 */
class InMemoryHandoffTokenRepository : public ports::output::IHandoffTokenRepository {
public:
    void save(const domain::HandoffToken& token) override {
        tokens_.insert(token.token, std::make_shared<domain::HandoffToken>(token));
    }

    std::optional<domain::HandoffToken> findByToken(const std::string& token) override {
        auto record = tokens_.find(token);
        if (!record) return std::nullopt;
        return *record;
    }

    bool deleteByToken(const std::string& token) override {
        return tokens_.erase(token);
    }

    size_t deleteExpired(std::chrono::system_clock::time_point now) override {
        return tokens_.eraseIf([now](const domain::HandoffToken& record) {
            return record.expiresAt < now;
        });
    }

    size_t size() const override {
        return tokens_.size();
    }

private:
    ThreadSafeMap<std::string, domain::HandoffToken> tokens_;
};

} // namespace bridge::adapters::secondary
