#pragma once

#include "domain/SessionContext.hpp"
#include "domain/enums/AuthError.hpp"
#include "domain/enums/GuardOutcome.hpp"
#include <string>
#include <optional>

namespace bridge::ports::input {

/**
 * @brief Решение guard'а по запросу
 *
 * context - контекст после проверки (обновлённая или уничтоженная сессия),
 * его и нужно передавать следующему этапу.
 */
struct GuardResult {
    domain::GuardOutcome outcome = domain::GuardOutcome::REJECT;
    domain::AuthError error = domain::AuthError::NONE;
    std::string message;
    std::string redirectUrl;                            ///< Только для REDIRECT
    std::optional<domain::AuthorizedPrincipal> principal; ///< Только для ALLOW
    domain::SessionContext context;

    bool allowed() const { return outcome == domain::GuardOutcome::ALLOW; }
};

/**
 * @brief Проверка доступа к маршрутам одного типа доменов
 */
class ISessionGuard {
public:
    virtual ~ISessionGuard() = default;

    virtual GuardResult authorize(const domain::SessionContext& ctx) = 0;
};

} // namespace bridge::ports::input
