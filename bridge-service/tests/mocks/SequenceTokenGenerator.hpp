#pragma once

#include "ports/output/ITokenGenerator.hpp"
#include <atomic>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bridge::tests::mocks {

/**
 * @brief Детерминированный генератор: "tok-00000001", "tok-00000002", ...
 *
 * setFailing(true) имитирует отказ источника энтропии.
 */
class SequenceTokenGenerator : public ports::output::ITokenGenerator {
public:
    explicit SequenceTokenGenerator(const std::string& prefix = "tok-") : prefix_(prefix) {}

    std::string generate() override {
        if (failing_) {
            throw std::runtime_error("RAND_bytes failed");
        }
        std::ostringstream out;
        out << prefix_ << std::setw(8) << std::setfill('0') << ++counter_;
        return out.str();
    }

    int generated() const { return counter_; }

    void setFailing(bool failing) { failing_ = failing; }

private:
    std::string prefix_;
    std::atomic<int> counter_{0};
    std::atomic<bool> failing_{false};
};

} // namespace bridge::tests::mocks
