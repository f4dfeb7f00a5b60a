// include/fund_ngin/fund/investor_registry.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"

namespace fund_ngin {

enum class InvestorStatus {
    ACTIVE,
    INACTIVE
};

std::string investor_status_to_string(InvestorStatus status);

struct InvestorAccount {
    std::string investor_id;
    std::string name;
    InvestorStatus status{InvestorStatus::ACTIVE};

    bool is_active() const { return status == InvestorStatus::ACTIVE; }

    nlohmann::json to_json() const;
};

/**
 * @brief Investor accounts keyed by unique id
 */
class InvestorRegistry {
public:
    /**
     * @brief Add a new account
     * @return INVALID_ARGUMENT for an empty or duplicate id
     */
    Result<void> register_investor(const InvestorAccount& account);

    /**
     * @brief Register the investor when unknown, otherwise leave it untouched
     * @return true when a new account was created
     */
    bool ensure_investor(const std::string& investor_id, const std::string& name);

    Result<void> set_status(const std::string& investor_id, InvestorStatus status);

    Result<InvestorAccount> get(const std::string& investor_id) const;

    bool contains(const std::string& investor_id) const {
        return accounts_.count(investor_id) > 0;
    }

    std::vector<InvestorAccount> all() const;

    std::vector<InvestorAccount> active() const;

    size_t size() const { return accounts_.size(); }

private:
    std::map<std::string, InvestorAccount> accounts_;
};

}  // namespace fund_ngin
