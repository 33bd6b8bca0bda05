#pragma once

#include <string>

namespace bridge::domain {

/**
 * @brief Терминальный исход проверки guard'а
 */
enum class GuardOutcome {
    ALLOW,      ///< Запрос пропускается дальше
    REDIRECT,   ///< Редирект на логин с подсказкой тенанта
    REJECT      ///< Отказ (401)
};

inline std::string toString(GuardOutcome outcome) {
    switch (outcome) {
        case GuardOutcome::ALLOW:    return "ALLOW";
        case GuardOutcome::REDIRECT: return "REDIRECT";
        case GuardOutcome::REJECT:   return "REJECT";
        default: return "UNKNOWN";
    }
}

} // namespace bridge::domain
