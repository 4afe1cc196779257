#include "services/AccountService.hpp"

#include "domain/Errors.hpp"

#include <iostream>

using namespace sgw::domain;

namespace sgw::services {

AccountService::AccountService(const IUpstreamClient& upstream)
    : upstream_(upstream) {}

WalletInfo AccountService::wallet() const {
    try {
        return mapper_.wallet_from_json(upstream_.fetch_wallet());
    } catch (const GatewayError& e) {
        std::cerr << "[account] wallet " << to_string(e.kind())
                  << " upstream=" << upstream_.base_url()
                  << " detail=" << e.what() << std::endl;
        throw;
    }
}

ChequebookInfo AccountService::chequebook() const {
    try {
        auto address = upstream_.fetch_chequebook_address();
        auto balance = upstream_.fetch_chequebook_balance();
        return mapper_.chequebook_from_json(address, balance);
    } catch (const GatewayError& e) {
        std::cerr << "[account] chequebook " << to_string(e.kind())
                  << " upstream=" << upstream_.base_url()
                  << " detail=" << e.what() << std::endl;
        throw;
    }
}

} // namespace sgw::services
