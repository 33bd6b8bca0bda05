#pragma once

#include "domain/HandoffToken.hpp"
#include <string>
#include <optional>
#include <chrono>

namespace bridge::ports::output {

/**
 * @brief Хранилище записей одноразовых токенов
 *
 * Реализации обязаны быть потокобезопасными.
 */
class IHandoffTokenRepository {
public:
    virtual ~IHandoffTokenRepository() = default;

    virtual void save(const domain::HandoffToken& token) = 0;
    virtual std::optional<domain::HandoffToken> findByToken(const std::string& token) = 0;
    virtual bool deleteByToken(const std::string& token) = 0;

    /**
     * @brief Удалить записи с expiresAt < now
     * @return Количество удалённых
     */
    virtual size_t deleteExpired(std::chrono::system_clock::time_point now) = 0;

    virtual size_t size() const = 0;
};

} // namespace bridge::ports::output
