#pragma once

#include "domain/Account.hpp"
#include "infrastructure/AccountMapper.hpp"
#include "services/IUpstreamClient.hpp"

namespace sgw::services {

class AccountService {
public:
    explicit AccountService(const IUpstreamClient& upstream);

    sgw::domain::WalletInfo wallet() const;
    sgw::domain::ChequebookInfo chequebook() const;

    const sgw::infrastructure::AccountMapper& mapper() const noexcept { return mapper_; }

private:
    const IUpstreamClient& upstream_;
    sgw::infrastructure::AccountMapper mapper_;
};

} // namespace sgw::services
