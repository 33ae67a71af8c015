#include "protocol_config.hpp"

namespace vault_ledger {

bool ProtocolConfig::operator==(const ProtocolConfig& o) const {
    return initialized == o.initialized &&
           admin == o.admin &&
           operator_id == o.operator_id &&
           fee_recipient == o.fee_recipient &&
           treasury == o.treasury &&
           total_shares == o.total_shares &&
           total_trading_deployed == o.total_trading_deployed &&
           accumulated_fees == o.accumulated_fees &&
           performance_fee_bps == o.performance_fee_bps &&
           max_deployment_bps == o.max_deployment_bps &&
           is_paused == o.is_paused &&
           last_fee_sweep == o.last_fee_sweep &&
           deployed_current_value == o.deployed_current_value &&
           last_valuation_timestamp == o.last_valuation_timestamp &&
           last_deployment_timestamp == o.last_deployment_timestamp &&
           deployment_started_at == o.deployment_started_at &&
           pending_unrealized_fees == o.pending_unrealized_fees;
}

Result<ProtocolConfig> ConfigStore::build_initial(const InitializeParams& params) {
    if (params.admin.empty() || params.operator_id.empty()) {
        return VaultError::INVALID_IDENTITY;
    }
    if (params.performance_fee_bps > BPS_DENOMINATOR) {
        return VaultError::INVALID_FEE_BPS;
    }
    if (params.max_deployment_bps > BPS_DENOMINATOR) {
        return VaultError::INVALID_AMOUNT;
    }

    ProtocolConfig cfg;
    cfg.initialized = true;
    cfg.admin = params.admin;
    cfg.operator_id = params.operator_id;
    cfg.fee_recipient = params.fee_recipient.empty() ? params.admin : params.fee_recipient;
    cfg.performance_fee_bps = params.performance_fee_bps;
    cfg.max_deployment_bps = params.max_deployment_bps;
    return cfg;
}

} // namespace vault_ledger
