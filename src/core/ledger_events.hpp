#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <nlohmann/json.hpp>
#include "fixed_point.hpp"

namespace vault_ledger {

enum class LedgerEventType {
    PROTOCOL_INITIALIZED,
    POSITION_CREATED,
    DEPOSIT,
    WITHDRAW,
    CAPITAL_DEPLOYED,
    CAPITAL_RETURNED,
    VALUATION_UPDATED,
    FEES_SWEPT,
    PAUSE_CHANGED
};

struct ProtocolInitializedData {
    std::string admin;
    std::string operator_id;
    std::string fee_recipient;
    uint32_t performance_fee_bps;
    uint32_t max_deployment_bps;
};

struct PositionCreatedData {
    std::string owner;
};

struct DepositData {
    std::string user;
    Amount amount;
    Shares shares_minted;
    Amount treasury_balance;
};

struct WithdrawData {
    std::string user;
    Amount amount;
    Shares shares_burned;
    Shares remaining_shares;
};

struct CapitalDeployedData {
    Amount amount;
    Amount total_deployed;
    Amount treasury_remaining;
};

struct CapitalReturnedData {
    Amount amount;
    SignedAmount profit_or_loss;
    Amount principal_returned;
    Amount fee_accrued;
    Amount new_treasury_balance;
};

// Record consumed by external monitoring after every admitted mark.
struct ValuationUpdatedData {
    std::string deployment_id;
    Amount total_deployed_original;
    Amount total_deployed_current;
    Amount orca_value;
    Amount drift_value;
    Amount uncollected_fees;
    SignedAmount unrealized_pnl;
    Amount pending_fees;
    UnixSeconds valuation_timestamp;
};

struct FeesSweptData {
    std::string recipient;
    Amount amount;
};

struct PauseChangedData {
    bool paused;
};

using LedgerEventPayload = std::variant<ProtocolInitializedData, PositionCreatedData, DepositData,
                                        WithdrawData, CapitalDeployedData, CapitalReturnedData,
                                        ValuationUpdatedData, FeesSweptData, PauseChangedData>;

struct LedgerEvent {
    uint64_t sequence{0};
    UnixSeconds timestamp{0};
    LedgerEventType event_type;
    LedgerEventPayload data;
};

inline const char* to_string(LedgerEventType t) {
    switch (t) {
        case LedgerEventType::PROTOCOL_INITIALIZED: return "protocol_initialized";
        case LedgerEventType::POSITION_CREATED: return "position_created";
        case LedgerEventType::DEPOSIT: return "deposit";
        case LedgerEventType::WITHDRAW: return "withdraw";
        case LedgerEventType::CAPITAL_DEPLOYED: return "capital_deployed";
        case LedgerEventType::CAPITAL_RETURNED: return "capital_returned";
        case LedgerEventType::VALUATION_UPDATED: return "valuation_updated";
        case LedgerEventType::FEES_SWEPT: return "fees_swept";
        case LedgerEventType::PAUSE_CHANGED: return "pause_changed";
    }
    return "unknown";
}

inline nlohmann::json event_to_json(const LedgerEvent& ev) {
    nlohmann::json j{
        {"seq", ev.sequence},
        {"ts", ev.timestamp},
        {"event", to_string(ev.event_type)}
    };
    std::visit([&j](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, ProtocolInitializedData>) {
            j["admin"] = d.admin;
            j["operator"] = d.operator_id;
            j["fee_recipient"] = d.fee_recipient;
            j["performance_fee_bps"] = d.performance_fee_bps;
            j["max_deployment_bps"] = d.max_deployment_bps;
        } else if constexpr (std::is_same_v<T, PositionCreatedData>) {
            j["owner"] = d.owner;
        } else if constexpr (std::is_same_v<T, DepositData>) {
            j["user"] = d.user;
            j["amount"] = d.amount;
            j["shares_minted"] = d.shares_minted;
            j["treasury_balance"] = d.treasury_balance;
        } else if constexpr (std::is_same_v<T, WithdrawData>) {
            j["user"] = d.user;
            j["amount"] = d.amount;
            j["shares_burned"] = d.shares_burned;
            j["remaining_shares"] = d.remaining_shares;
        } else if constexpr (std::is_same_v<T, CapitalDeployedData>) {
            j["amount"] = d.amount;
            j["total_deployed"] = d.total_deployed;
            j["treasury_remaining"] = d.treasury_remaining;
        } else if constexpr (std::is_same_v<T, CapitalReturnedData>) {
            j["amount"] = d.amount;
            j["profit_or_loss"] = d.profit_or_loss;
            j["principal_returned"] = d.principal_returned;
            j["fee_accrued"] = d.fee_accrued;
            j["new_treasury_balance"] = d.new_treasury_balance;
        } else if constexpr (std::is_same_v<T, ValuationUpdatedData>) {
            j["deployment_id"] = d.deployment_id;
            j["total_deployed_original"] = d.total_deployed_original;
            j["total_deployed_current"] = d.total_deployed_current;
            j["orca_value"] = d.orca_value;
            j["drift_value"] = d.drift_value;
            j["uncollected_fees"] = d.uncollected_fees;
            j["unrealized_pnl"] = d.unrealized_pnl;
            j["pending_fees"] = d.pending_fees;
            j["timestamp"] = d.valuation_timestamp;
        } else if constexpr (std::is_same_v<T, FeesSweptData>) {
            j["recipient"] = d.recipient;
            j["amount"] = d.amount;
        } else if constexpr (std::is_same_v<T, PauseChangedData>) {
            j["paused"] = d.paused;
        }
    }, ev.data);
    return j;
}

} // namespace vault_ledger
