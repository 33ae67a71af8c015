#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "errors.hpp"
#include "protocol_config.hpp"
#include "share_ledger.hpp"
#include "treasury_account.hpp"
#include "ledger_events.hpp"

namespace vault_ledger {

/**
 * Staged view of the ledger for a single operation.
 *
 * Reads fall through to the committed state; writes land on private copies
 * of the config, the treasury and every touched position. Nothing reaches the
 * committed state until commit(), which is only legal after verify() passes.
 * Dropping the transaction discards all staged writes.
 */
class LedgerTransaction {
public:
    LedgerTransaction(const ConfigStore& config, const TreasuryAccount& treasury, const ShareLedger& ledger);

    ProtocolConfig& config() { return config_; }
    const ProtocolConfig& config() const { return config_; }
    TreasuryAccount& treasury() { return treasury_; }
    const TreasuryAccount& treasury() const { return treasury_; }

    // Staged copy of the owner's position, or nullptr if none exists.
    UserPosition* position(const std::string& owner);
    UserPosition& create_position(const std::string& owner, UnixSeconds now);

    NavInputs nav_inputs() const;

    void emit(LedgerEventType type, LedgerEventPayload payload);
    const std::vector<std::pair<LedgerEventType, LedgerEventPayload>>& events() const { return events_; }

    /**
     * Post-condition checks on the staged state:
     *  - fee bps within [0, 10000] and deployment bps within [0, 10000]
     *  - last valuation timestamp did not move backwards
     *  - change in total_shares equals the net change over touched positions
     *  - accumulated fees are covered by idle + deployed value
     */
    VaultError verify() const;

    void commit(ConfigStore& config, TreasuryAccount& treasury, ShareLedger& ledger) const;

private:
    const ProtocolConfig& base_config_;
    const ShareLedger& base_ledger_;
    ProtocolConfig config_;
    TreasuryAccount treasury_;
    std::unordered_map<std::string, UserPosition> staged_;
    std::vector<std::pair<LedgerEventType, LedgerEventPayload>> events_;
};

} // namespace vault_ledger
