#include "control_server.hpp"
#include "../core/utils.hpp"
#include <spdlog/spdlog.h>
#include <drogon/drogon.h>
#include <cstdint>

using json = nlohmann::json;

namespace vault_ledger {

namespace {

int http_status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::AUTHORIZATION: return 403;
        case ErrorCategory::STATE: return 409;
        case ErrorCategory::ARITHMETIC: return 422;
        case ErrorCategory::LIQUIDITY: return 409;
        case ErrorCategory::VALUATION: return 422;
        case ErrorCategory::NOT_FOUND: return 404;
        case ErrorCategory::NONE: return 200;
    }
    return 500;
}

// Integers are raw 1e6 units; strings are decimal display amounts ("12.5").
std::optional<Amount> read_amount(const json& body, const char* key) {
    if (!body.contains(key)) return std::nullopt;
    const auto& v = body[key];
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) {
        auto i = v.get<int64_t>();
        if (i < 0) return std::nullopt;
        return static_cast<Amount>(i);
    }
    if (v.is_string()) return utils::parse_amount(v.get<std::string>());
    return std::nullopt;
}

std::optional<SignedAmount> read_signed_amount(const json& body, const char* key) {
    if (!body.contains(key)) return std::nullopt;
    const auto& v = body[key];
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_string()) {
        auto s = v.get<std::string>();
        bool negative = !s.empty() && s[0] == '-';
        auto magnitude = utils::parse_amount(negative ? s.substr(1) : s);
        if (!magnitude || *magnitude > static_cast<Amount>(INT64_MAX)) return std::nullopt;
        auto signed_value = static_cast<SignedAmount>(*magnitude);
        return negative ? -signed_value : signed_value;
    }
    return std::nullopt;
}

json position_to_json(const UserPosition& p) {
    return json{
        {"owner", p.owner},
        {"shares", p.shares},
        {"deposited_amount", p.deposited_amount},
        {"withdrawn_amount", p.withdrawn_amount},
        {"high_water_mark", p.high_water_mark},
        {"created_at", utils::sec_to_iso(p.created_at)}
    };
}

} // namespace

ControlServer::ControlServer(std::shared_ptr<AccountingEngine> engine, const Config& cfg)
    : engine_(std::move(engine))
    , cfg_(cfg)
    , throttle_(cfg.auth.requests_per_minute, std::chrono::seconds(60)) {
    engine_->add_event_callback([this](const LedgerEvent& ev) {
        on_event(ev);
    });
}

drogon::HttpResponsePtr ControlServer::unauthorized() {
    return json_resp(json{{"error", "unauthorized"}}, 401);
}

drogon::HttpResponsePtr ControlServer::bad_request(const std::string& message) {
    return json_resp(json{{"error", "BadRequest"}, {"message", message}}, 400);
}

drogon::HttpResponsePtr ControlServer::error_resp(VaultError err) {
    auto category = error_category(err);
    return json_resp(json{
        {"error", to_string(err)},
        {"category", to_string(category)},
        {"message", describe(err)}
    }, http_status_for(category));
}

drogon::HttpResponsePtr ControlServer::json_resp(json body, int code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

drogon::HttpResponsePtr ControlServer::admit(const drogon::HttpRequestPtr& req) {
    // X-Caller is client-supplied, so it only becomes the throttle key once the token checks out.
    auto peer = "peer:" + req->getPeerAddr().toIp();
    bool authenticated = cfg_.auth.token.empty() ||
                         req->getHeader("authorization") == "Bearer " + cfg_.auth.token;
    auto caller = caller_of(req);
    auto key = (!authenticated || caller.empty()) ? peer : "caller:" + caller;
    if (!throttle_.allow(key)) {
        spdlog::warn("Throttled request {} from {}", req->path(), key);
        return json_resp(json{{"error", "rate_limited"}}, 429);
    }
    if (!authenticated) return unauthorized();
    return nullptr;
}

std::string ControlServer::caller_of(const drogon::HttpRequestPtr& req) const {
    return req->getHeader("x-caller");
}

std::optional<json> ControlServer::parse_body(const drogon::HttpRequestPtr& req) {
    auto body = req->getBody();
    if (body.empty()) return json::object();
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

void ControlServer::initialize(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto body = parse_body(req);
    if (!body) { callback(bad_request("invalid JSON body")); return; }
    InitializeParams params = cfg_.vault.initialize_params();
    params.admin = body->value("admin", params.admin);
    params.operator_id = body->value("operator", params.operator_id);
    params.performance_fee_bps = body->value("performance_fee_bps", params.performance_fee_bps);
    params.fee_recipient = body->value("fee_recipient", params.fee_recipient);
    params.max_deployment_bps = body->value("max_deployment_bps", params.max_deployment_bps);

    auto res = engine_->initialize_protocol(caller_of(req), params);
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{
        {"admin", res->admin},
        {"operator", res->operator_id},
        {"fee_recipient", res->fee_recipient},
        {"performance_fee_bps", res->performance_fee_bps},
        {"max_deployment_bps", res->max_deployment_bps}
    }, 201));
}

void ControlServer::pause(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto res = engine_->pause_protocol(caller_of(req));
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{{"paused", *res}}));
}

void ControlServer::unpause(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto res = engine_->unpause_protocol(caller_of(req));
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{{"paused", *res}}));
}

void ControlServer::stats(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto res = engine_->protocol_stats();
    if (!res) { callback(error_resp(res.error())); return; }
    const auto& s = *res;
    callback(json_resp(json{
        {"tvl", s.tvl},
        {"tvl_display", utils::format_amount(s.tvl)},
        {"idle_balance", s.idle_balance},
        {"total_trading_deployed", s.total_trading_deployed},
        {"deployed_current_value", s.deployed_current_value},
        {"accumulated_fees", s.accumulated_fees},
        {"pending_unrealized_fees", s.pending_unrealized_fees},
        {"total_shares", s.total_shares},
        {"nav_per_share", s.nav_per_share},
        {"nav_per_share_display", utils::format_amount(s.nav_per_share)},
        {"position_count", s.position_count},
        {"paused", s.paused},
        {"valuation_stale", s.valuation_stale},
        {"last_valuation", utils::sec_to_iso(s.last_valuation_timestamp)},
        {"last_fee_sweep", utils::sec_to_iso(s.last_fee_sweep)}
    }));
}

void ControlServer::createPosition(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto res = engine_->create_user_position(caller_of(req));
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(position_to_json(*res), 201));
}

void ControlServer::getPosition(const drogon::HttpRequestPtr& req, Callback&& callback, std::string owner) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto res = engine_->user_stats(owner);
    if (!res) { callback(error_resp(res.error())); return; }
    const auto& s = *res;
    callback(json_resp(json{
        {"owner", s.owner},
        {"shares", s.shares},
        {"balance", s.balance},
        {"deposited_amount", s.deposited_amount},
        {"withdrawn_amount", s.withdrawn_amount},
        {"high_water_mark", s.high_water_mark},
        {"gain_above_high_water_mark", s.gain_above_high_water_mark}
    }));
}

void ControlServer::balance(const drogon::HttpRequestPtr& req, Callback&& callback, std::string owner) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto res = engine_->calculate_user_balance(owner);
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{
        {"owner", owner},
        {"amount", res->amount},
        {"amount_display", utils::format_amount(res->amount)},
        {"stale", res->stale},
        {"valuation_age_sec", res->valuation_age_sec}
    }));
}

void ControlServer::deposit(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto body = parse_body(req);
    if (!body) { callback(bad_request("invalid JSON body")); return; }
    auto amount = read_amount(*body, "amount");
    if (!amount) { callback(bad_request("amount is required")); return; }
    Shares min_shares = read_amount(*body, "min_shares").value_or(0);

    auto res = engine_->deposit(caller_of(req), *amount, min_shares);
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{
        {"owner", res->owner},
        {"amount", res->amount},
        {"shares_minted", res->shares_minted},
        {"position_shares", res->position_shares},
        {"total_shares", res->total_shares},
        {"treasury_balance", res->treasury_balance}
    }));
}

void ControlServer::withdraw(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto body = parse_body(req);
    if (!body) { callback(bad_request("invalid JSON body")); return; }
    auto shares = read_amount(*body, "shares");
    if (!shares) { callback(bad_request("shares is required")); return; }
    Amount min_payout = read_amount(*body, "min_payout").value_or(0);

    auto res = engine_->withdraw(caller_of(req), *shares, min_payout);
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{
        {"owner", res->owner},
        {"payout", res->payout},
        {"shares_burned", res->shares_burned},
        {"remaining_shares", res->remaining_shares},
        {"treasury_balance", res->treasury_balance}
    }));
}

void ControlServer::withdrawAmount(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto body = parse_body(req);
    if (!body) { callback(bad_request("invalid JSON body")); return; }
    auto amount = read_amount(*body, "amount");
    auto max_shares = read_amount(*body, "max_shares");
    if (!amount || !max_shares) { callback(bad_request("amount and max_shares are required")); return; }

    auto res = engine_->withdraw_amount(caller_of(req), *amount, *max_shares);
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{
        {"owner", res->owner},
        {"payout", res->payout},
        {"shares_burned", res->shares_burned},
        {"remaining_shares", res->remaining_shares},
        {"treasury_balance", res->treasury_balance}
    }));
}

void ControlServer::deploy(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto body = parse_body(req);
    if (!body) { callback(bad_request("invalid JSON body")); return; }
    auto amount = read_amount(*body, "amount");
    if (!amount) { callback(bad_request("amount is required")); return; }

    auto res = engine_->deploy_capital_for_trading(caller_of(req), *amount);
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{
        {"amount", res->amount},
        {"total_deployed", res->total_deployed},
        {"deployed_current_value", res->deployed_current_value},
        {"treasury_remaining", res->treasury_remaining}
    }));
}

void ControlServer::returnCapital(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto body = parse_body(req);
    if (!body) { callback(bad_request("invalid JSON body")); return; }
    auto amount = read_amount(*body, "amount_returned");
    auto pnl = read_signed_amount(*body, "realized_pnl");
    if (!amount || !pnl) { callback(bad_request("amount_returned and realized_pnl are required")); return; }

    auto res = engine_->return_capital_from_trading(caller_of(req), *amount, *pnl);
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{
        {"amount_returned", res->amount_returned},
        {"principal_returned", res->principal_returned},
        {"realized_pnl", res->realized_pnl},
        {"fee_accrued", res->fee_accrued},
        {"total_deployed", res->total_deployed},
        {"treasury_balance", res->treasury_balance}
    }));
}

void ControlServer::valuation(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto body = parse_body(req);
    if (!body) { callback(bad_request("invalid JSON body")); return; }

    ValuationReport report;
    report.deployment_id = body->value("deployment_id", "");
    auto orca = read_amount(*body, "orca_positions_value");
    auto drift = read_amount(*body, "drift_equity_value");
    auto fees = read_amount(*body, "uncollected_fees");
    auto pnl = read_signed_amount(*body, "unrealized_pnl");
    if (!orca || !drift || !fees || !pnl) {
        callback(bad_request("valuation components are required"));
        return;
    }
    report.orca_positions_value = *orca;
    report.drift_equity_value = *drift;
    report.uncollected_fees = *fees;
    report.unrealized_pnl = *pnl;
    if (body->contains("timestamp") && (*body)["timestamp"].is_string()) {
        auto ts = utils::parse_iso_sec((*body)["timestamp"].get<std::string>());
        if (!ts) { callback(bad_request("timestamp must be ISO 8601")); return; }
        report.timestamp = *ts;
    } else {
        report.timestamp = body->value("timestamp", engine_->clock()->now_sec());
    }

    auto res = engine_->update_deployment_valuation(caller_of(req), report);
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{
        {"deployed_current_value", res->deployed_current_value},
        {"pending_unrealized_fees", res->pending_unrealized_fees},
        {"timestamp", utils::sec_to_iso(res->timestamp)}
    }));
}

void ControlServer::sweepFees(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    auto res = engine_->sweep_fees(caller_of(req));
    if (!res) { callback(error_resp(res.error())); return; }
    callback(json_resp(json{{"swept", *res}, {"swept_display", utils::format_amount(*res)}}));
}

void ControlServer::events(const drogon::HttpRequestPtr& req, Callback&& callback) {
    if (auto denied = admit(req)) { callback(denied); return; }
    size_t limit = 100;
    uint64_t after = 0;
    try {
        auto lim = req->getParameter("limit");
        if (!lim.empty()) limit = std::stoul(lim);
        auto aft = req->getParameter("after");
        if (!aft.empty()) after = std::stoull(aft);
    } catch (const std::exception& e) {
        callback(bad_request(std::string("invalid query parameter: ") + e.what()));
        return;
    }
    json arr = json::array();
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        for (const auto& j : events_) {
            if (arr.size() >= limit) break;
            if (j.value("seq", uint64_t{0}) <= after) continue;
            arr.push_back(j);
        }
    }
    callback(json_resp(arr));
}

void ControlServer::on_event(const LedgerEvent& ev) {
    auto j = event_to_json(ev);
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(std::move(j));
    if (events_.size() > max_events_) events_.pop_front();
}

} // namespace vault_ledger
