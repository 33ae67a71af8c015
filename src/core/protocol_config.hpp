#pragma once

#include <string>
#include <cstdint>
#include "errors.hpp"
#include "fixed_point.hpp"

namespace vault_ledger {

constexpr uint32_t DEFAULT_PERFORMANCE_FEE_BPS = 2500;  // 25%
constexpr uint32_t DEFAULT_MAX_DEPLOYMENT_BPS = 9000;   // 90% of pooled value
constexpr const char* TREASURY_ACCOUNT_ID = "treasury";

/**
 * Protocol-wide authorities and aggregate accounting state.
 */
struct ProtocolConfig {
    bool initialized{false};
    std::string admin;
    std::string operator_id;      // trading bot
    std::string fee_recipient;
    std::string treasury{TREASURY_ACCOUNT_ID};
    Shares total_shares{0};
    Amount total_trading_deployed{0};
    Amount accumulated_fees{0};
    uint32_t performance_fee_bps{DEFAULT_PERFORMANCE_FEE_BPS};
    uint32_t max_deployment_bps{DEFAULT_MAX_DEPLOYMENT_BPS};
    bool is_paused{false};
    UnixSeconds last_fee_sweep{0};
    Amount deployed_current_value{0};
    UnixSeconds last_valuation_timestamp{0};
    UnixSeconds last_deployment_timestamp{0};
    // First deployment since total_trading_deployed was last zero.
    UnixSeconds deployment_started_at{0};
    Amount pending_unrealized_fees{0};

    bool operator==(const ProtocolConfig& o) const;
    bool operator!=(const ProtocolConfig& o) const { return !(*this == o); }
};

struct InitializeParams {
    std::string admin;
    std::string operator_id;
    uint32_t performance_fee_bps{DEFAULT_PERFORMANCE_FEE_BPS};
    std::string fee_recipient;    // empty = admin
    uint32_t max_deployment_bps{DEFAULT_MAX_DEPLOYMENT_BPS};
};

/**
 * Owner of the singleton ProtocolConfig. Initialized exactly once; every
 * later mutation goes through replace() at transaction commit.
 */
class ConfigStore {
public:
    ConfigStore() = default;

    // Validates params and builds the initial record without installing it.
    static Result<ProtocolConfig> build_initial(const InitializeParams& params);

    bool initialized() const { return config_.initialized; }
    const ProtocolConfig& get() const { return config_; }

    void replace(const ProtocolConfig& cfg) { config_ = cfg; }

    bool is_admin(const std::string& caller) const {
        return config_.initialized && !caller.empty() && caller == config_.admin;
    }
    bool is_operator(const std::string& caller) const {
        return config_.initialized && !caller.empty() && caller == config_.operator_id;
    }

private:
    ProtocolConfig config_;
};

} // namespace vault_ledger
