#pragma once

#include "ports/input/IHandoffTokenService.hpp"
#include "ports/output/IHandoffTokenRepository.hpp"
#include "ports/output/ITokenGenerator.hpp"
#include "ports/output/IClock.hpp"
#include "application/DomainRouter.hpp"
#include "settings/BridgeSettings.hpp"
#include <memory>
#include <mutex>
#include <iostream>

namespace bridge::application {

/**
 * @brief Token Store: выпуск, погашение и очистка одноразовых токенов
 *
 * redeem() выполняет lookup → проверку срока → удаление под одним мьютексом,
 * поэтому один токен гасится не более одного раза. sweep() мьютекс
 * не берёт и может работать параллельно с issue/redeem.
 */
class HandoffTokenService : public ports::input::IHandoffTokenService {
public:
    HandoffTokenService(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<ports::output::IHandoffTokenRepository> tokenRepo,
        std::shared_ptr<ports::output::ITokenGenerator> tokenGenerator,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<DomainRouter> domainRouter
    ) : settings_(std::move(settings))
      , tokenRepo_(std::move(tokenRepo))
      , tokenGenerator_(std::move(tokenGenerator))
      , clock_(std::move(clock))
      , domainRouter_(std::move(domainRouter))
    {
        std::cout << "[HandoffTokenService] Created (ttl="
                  << settings_->getHandoffTokenTtl().count() << "ms)" << std::endl;
    }

    std::string issue(const std::string& principalId, const std::string& tenantId) override {
        auto now = clock_->now();
        domain::HandoffToken record(
            tokenGenerator_->generate(),
            principalId,
            tenantId,
            now + settings_->getHandoffTokenTtl()
        );
        tokenRepo_->save(record);

        std::cout << "[HandoffTokenService] Issued token " << shortToken(record.token)
                  << " for user " << principalId << " -> tenant " << tenantId << std::endl;

        // Попутная очистка
        sweep();
        return record.token;
    }

    ports::input::TokenRedeemResult redeem(
        const std::string& token,
        const std::string& requestHost
    ) override {
        std::lock_guard<std::mutex> lock(redeemMutex_);

        auto record = tokenRepo_->findByToken(token);
        if (!record) {
            std::cerr << "[HandoffTokenService] Invalid or expired token "
                      << shortToken(token) << std::endl;
            return failure(domain::AuthError::TOKEN_INVALID, "Invalid or expired token");
        }

        if (record->isExpiredAt(clock_->now())) {
            std::cerr << "[HandoffTokenService] Token expired " << shortToken(token) << std::endl;
            tokenRepo_->deleteByToken(token);
            return failure(domain::AuthError::TOKEN_EXPIRED, "Token expired");
        }

        // Запись не удаляется: токен можно предъявить на правильном хосте
        if (!domainRouter_->hostMatchesTenant(requestHost, record->tenantId)) {
            std::cerr << "[HandoffTokenService] Token used on wrong tenant: "
                      << requestHost << " vs " << record->tenantId << std::endl;
            return failure(domain::AuthError::TENANT_MISMATCH, "Invalid tenant");
        }

        tokenRepo_->deleteByToken(token);

        ports::input::TokenRedeemResult result;
        result.success = true;
        result.principalId = record->principalId;
        result.tenantId = record->tenantId;
        result.message = "Token redeemed";
        return result;
    }

    size_t sweep() override {
        size_t removed = tokenRepo_->deleteExpired(clock_->now());
        if (removed > 0) {
            std::cout << "[HandoffTokenService] Swept " << removed << " expired token(s)" << std::endl;
        }
        return removed;
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<ports::output::IHandoffTokenRepository> tokenRepo_;
    std::shared_ptr<ports::output::ITokenGenerator> tokenGenerator_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<DomainRouter> domainRouter_;
    std::mutex redeemMutex_;

    static ports::input::TokenRedeemResult failure(domain::AuthError error, const std::string& message) {
        ports::input::TokenRedeemResult result;
        result.success = false;
        result.error = error;
        result.message = message;
        return result;
    }

    static std::string shortToken(const std::string& token) {
        return token.substr(0, 8) + "...";
    }
};

} // namespace bridge::application
