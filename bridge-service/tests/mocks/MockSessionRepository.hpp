#pragma once

#include "ports/output/ISessionRepository.hpp"
#include <gmock/gmock.h>

namespace bridge::tests::mocks {

class MockSessionRepository : public ports::output::ISessionRepository {
public:
    MOCK_METHOD(void, save, (const domain::Session&), (override));
    MOCK_METHOD(bool, update, (const domain::Session&), (override));
    MOCK_METHOD(std::optional<domain::Session>, findById,
                (const domain::CookieScope&, const std::string&), (override));
    MOCK_METHOD(bool, deleteById, (const domain::CookieScope&, const std::string&), (override));
    MOCK_METHOD(size_t, deleteExpired, (std::chrono::system_clock::time_point), (override));
};

} // namespace bridge::tests::mocks
