#pragma once

#include <string>

namespace bridge::ports::output {

/**
 * @brief Генератор непредсказуемых строк (токены, ID сессий)
 */
class ITokenGenerator {
public:
    virtual ~ITokenGenerator() = default;

    /**
     * @brief Сгенерировать токен
     * @return hex-строка из 32 случайных байт (256 бит)
     */
    virtual std::string generate() = 0;
};

} // namespace bridge::ports::output
