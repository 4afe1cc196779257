#include "infrastructure/AccountMapper.hpp"

#include "domain/Errors.hpp"

#include <optional>
#include <string>

using json = nlohmann::json;
using namespace sgw::domain;

namespace sgw::infrastructure {

namespace {

std::string required_string(const json& obj, const char* key) {
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    }
    throw ValidationError(std::string("upstream response has no ") + key + " string");
}

// Balances are big integers; the node sends them as strings, older builds as numbers.
std::optional<std::string> balance(const json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return it->dump();
    return std::nullopt;
}

json nullable(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

WalletInfo AccountMapper::wallet_from_json(const json& wallet) const {
    return WalletInfo{
        required_string(wallet, "walletAddress"),
        balance(wallet, "bzzBalance"),
    };
}

ChequebookInfo AccountMapper::chequebook_from_json(const json& address, const json& balance_body) const {
    return ChequebookInfo{
        required_string(address, "chequebookAddress"),
        balance(balance_body, "availableBalance"),
        balance(balance_body, "totalBalance"),
    };
}

json AccountMapper::to_json(const WalletInfo& wallet) const {
    return json{
        {"walletAddress", wallet.wallet_address},
        {"bzzBalance", nullable(wallet.bzz_balance)},
    };
}

json AccountMapper::to_json(const ChequebookInfo& chequebook) const {
    return json{
        {"chequebookAddress", chequebook.chequebook_address},
        {"availableBalance", nullable(chequebook.available_balance)},
        {"totalBalance", nullable(chequebook.total_balance)},
    };
}

} // namespace sgw::infrastructure
