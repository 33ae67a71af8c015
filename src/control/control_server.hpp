#pragma once

#include <memory>
#include <string>
#include <deque>
#include <mutex>
#include <optional>
#include <drogon/HttpController.h>
#include <nlohmann/json.hpp>
#include "../core/accounting_engine.hpp"
#include "../core/config.hpp"
#include "../core/request_throttle.hpp"

namespace vault_ledger {

class ControlServer : public drogon::HttpController<ControlServer> {
public:
    static const bool isAutoCreation = false;
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(ControlServer::initialize, "/protocol/initialize", drogon::Post);
    ADD_METHOD_TO(ControlServer::pause, "/protocol/pause", drogon::Post);
    ADD_METHOD_TO(ControlServer::unpause, "/protocol/unpause", drogon::Post);
    ADD_METHOD_TO(ControlServer::stats, "/protocol/stats", drogon::Get);
    ADD_METHOD_TO(ControlServer::createPosition, "/positions", drogon::Post);
    ADD_METHOD_TO(ControlServer::getPosition, "/positions/{1}", drogon::Get);
    ADD_METHOD_TO(ControlServer::balance, "/positions/{1}/balance", drogon::Get);
    ADD_METHOD_TO(ControlServer::deposit, "/deposit", drogon::Post);
    ADD_METHOD_TO(ControlServer::withdraw, "/withdraw", drogon::Post);
    ADD_METHOD_TO(ControlServer::withdrawAmount, "/withdraw_amount", drogon::Post);
    ADD_METHOD_TO(ControlServer::deploy, "/trading/deploy", drogon::Post);
    ADD_METHOD_TO(ControlServer::returnCapital, "/trading/return", drogon::Post);
    ADD_METHOD_TO(ControlServer::valuation, "/valuation", drogon::Post);
    ADD_METHOD_TO(ControlServer::sweepFees, "/fees/sweep", drogon::Post);
    ADD_METHOD_TO(ControlServer::events, "/events", drogon::Get);
    METHOD_LIST_END

    using Callback = std::function<void (const drogon::HttpResponsePtr &)>;

    ControlServer(std::shared_ptr<AccountingEngine> engine, const Config& cfg);

    void initialize(const drogon::HttpRequestPtr& req, Callback&& callback);
    void pause(const drogon::HttpRequestPtr& req, Callback&& callback);
    void unpause(const drogon::HttpRequestPtr& req, Callback&& callback);
    void stats(const drogon::HttpRequestPtr& req, Callback&& callback);
    void createPosition(const drogon::HttpRequestPtr& req, Callback&& callback);
    void getPosition(const drogon::HttpRequestPtr& req, Callback&& callback, std::string owner);
    void balance(const drogon::HttpRequestPtr& req, Callback&& callback, std::string owner);
    void deposit(const drogon::HttpRequestPtr& req, Callback&& callback);
    void withdraw(const drogon::HttpRequestPtr& req, Callback&& callback);
    void withdrawAmount(const drogon::HttpRequestPtr& req, Callback&& callback);
    void deploy(const drogon::HttpRequestPtr& req, Callback&& callback);
    void returnCapital(const drogon::HttpRequestPtr& req, Callback&& callback);
    void valuation(const drogon::HttpRequestPtr& req, Callback&& callback);
    void sweepFees(const drogon::HttpRequestPtr& req, Callback&& callback);
    void events(const drogon::HttpRequestPtr& req, Callback&& callback);

    // event propagation
    void on_event(const LedgerEvent& ev);

private:
    drogon::HttpResponsePtr unauthorized();
    drogon::HttpResponsePtr bad_request(const std::string& message);
    drogon::HttpResponsePtr error_resp(VaultError err);
    drogon::HttpResponsePtr json_resp(nlohmann::json body, int code = 200);

    // nullptr when the request may proceed, otherwise the rejection to send.
    drogon::HttpResponsePtr admit(const drogon::HttpRequestPtr& req);
    std::string caller_of(const drogon::HttpRequestPtr& req) const;
    std::optional<nlohmann::json> parse_body(const drogon::HttpRequestPtr& req);

    std::shared_ptr<AccountingEngine> engine_;
    Config cfg_;

    std::mutex events_mutex_;
    std::deque<nlohmann::json> events_;
    size_t max_events_{5000};

    RequestThrottle throttle_;
};

} // namespace vault_ledger
