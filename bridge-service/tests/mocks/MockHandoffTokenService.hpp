#pragma once

#include "ports/input/IHandoffTokenService.hpp"
#include <gmock/gmock.h>

namespace bridge::tests::mocks {

class MockHandoffTokenService : public ports::input::IHandoffTokenService {
public:
    MOCK_METHOD(std::string, issue, (const std::string&, const std::string&), (override));
    MOCK_METHOD(ports::input::TokenRedeemResult, redeem, (const std::string&, const std::string&), (override));
    MOCK_METHOD(size_t, sweep, (), (override));
};

} // namespace bridge::tests::mocks
