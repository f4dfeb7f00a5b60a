// src/fund/investor_registry.cpp

#include "fund_ngin/fund/investor_registry.hpp"
#include "fund_ngin/core/logger.hpp"

namespace fund_ngin {

std::string investor_status_to_string(InvestorStatus status) {
    return status == InvestorStatus::ACTIVE ? "ACTIVE" : "INACTIVE";
}

nlohmann::json InvestorAccount::to_json() const {
    nlohmann::json j;
    j["investor_id"] = investor_id;
    j["name"] = name;
    j["status"] = investor_status_to_string(status);
    return j;
}

Result<void> InvestorRegistry::register_investor(const InvestorAccount& account) {
    if (account.investor_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Investor id is empty",
                                "InvestorRegistry");
    }
    if (contains(account.investor_id)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Investor already registered: " + account.investor_id,
                                "InvestorRegistry");
    }
    accounts_.emplace(account.investor_id, account);
    INFO("Registered investor " << account.investor_id << " (" << account.name << ")");
    return Result<void>();
}

bool InvestorRegistry::ensure_investor(const std::string& investor_id, const std::string& name) {
    if (investor_id.empty() || contains(investor_id)) {
        return false;
    }
    InvestorAccount account;
    account.investor_id = investor_id;
    account.name = name.empty() ? investor_id : name;
    accounts_.emplace(investor_id, account);
    return true;
}

Result<void> InvestorRegistry::set_status(const std::string& investor_id, InvestorStatus status) {
    auto it = accounts_.find(investor_id);
    if (it == accounts_.end()) {
        return make_error<void>(ErrorCode::UNKNOWN_INVESTOR, "Unknown investor: " + investor_id,
                                "InvestorRegistry");
    }
    it->second.status = status;
    return Result<void>();
}

Result<InvestorAccount> InvestorRegistry::get(const std::string& investor_id) const {
    auto it = accounts_.find(investor_id);
    if (it == accounts_.end()) {
        return make_error<InvestorAccount>(ErrorCode::UNKNOWN_INVESTOR,
                                           "Unknown investor: " + investor_id,
                                           "InvestorRegistry");
    }
    return it->second;
}

std::vector<InvestorAccount> InvestorRegistry::all() const {
    std::vector<InvestorAccount> accounts;
    accounts.reserve(accounts_.size());
    for (const auto& [id, account] : accounts_) {
        accounts.push_back(account);
    }
    return accounts;
}

std::vector<InvestorAccount> InvestorRegistry::active() const {
    std::vector<InvestorAccount> accounts;
    for (const auto& [id, account] : accounts_) {
        if (account.is_active()) {
            accounts.push_back(account);
        }
    }
    return accounts;
}

}  // namespace fund_ngin
