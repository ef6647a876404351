#include "rollup_adapter.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/logging/log_levels.hpp"
#include <sstream>

namespace rollup {

namespace {

std::string utf8_hex(const std::string& text) {
    return matching::to_hex(matching::Bytes(text.begin(), text.end()));
}

std::string compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

RollupAdapter::RollupAdapter(std::shared_ptr<IHttpHandler> http,
                             const std::string& base_url,
                             matching::BatchProcessor& processor,
                             int timeout_ms)
    : http_(std::move(http)), base_url_(base_url), processor_(processor), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

const char* RollupAdapter::finish_status_name(FinishStatus status) {
    return status == FinishStatus::REJECT ? "reject" : "accept";
}

HttpResponse RollupAdapter::post_json(const std::string& path, const Json::Value& body) {
    HttpRequest request;
    request.method = "POST";
    request.url = base_url_ + path;
    request.headers["Content-Type"] = "application/json";
    request.body = compact(body);
    request.timeout_ms = timeout_ms_;

    HttpResponse response = http_->make_request(request);
    if (!response.error_message.empty()) {
        ++stats_.http_errors;
        LOG_WARN_COMP(logging::components::ROLLUP_ADAPTER, "POST " + path + " failed: " + response.error_message);
    }
    return response;
}

PollOutcome RollupAdapter::poll_once() {
    Json::Value finish;
    finish["status"] = finish_status_name(next_status_);

    HttpResponse response = post_json("/finish", finish);
    if (!response.error_message.empty()) {
        return PollOutcome::FAILED;
    }
    ++stats_.finishes;

    if (response.status_code == constants::rollup::STATUS_NO_PENDING) {
        LOG_DEBUG_COMP(logging::components::ROLLUP_ADAPTER, "No pending rollup request");
        return PollOutcome::IDLE;
    }
    if (response.status_code != constants::rollup::STATUS_ACCEPTED) {
        ++stats_.http_errors;
        LOG_WARN_COMP(logging::components::ROLLUP_ADAPTER,
                      "Unexpected /finish status " + std::to_string(response.status_code));
        return PollOutcome::FAILED;
    }

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errors;
    std::istringstream body(response.body);
    if (!Json::parseFromStream(reader, body, &root, &errors) || !root.isObject()) {
        ++stats_.http_errors;
        LOG_WARN_COMP(logging::components::ROLLUP_ADAPTER, "Malformed /finish response: " + errors);
        return PollOutcome::FAILED;
    }

    const std::string request_type = root.get("request_type", "").asString();
    const Json::Value& data = root["data"];
    const std::string payload = data.isObject() ? data.get("payload", "").asString() : "";

    if (request_type == "advance_state") {
        ++stats_.advances;
        next_status_ = handle_advance(payload);
        return PollOutcome::ADVANCED;
    }
    if (request_type == "inspect_state") {
        ++stats_.inspects;
        handle_inspect();
        return PollOutcome::INSPECTED;
    }

    LOG_WARN_COMP(logging::components::ROLLUP_ADAPTER, "Unknown request type '" + request_type + "'");
    next_status_ = FinishStatus::REJECT;
    return PollOutcome::FAILED;
}

FinishStatus RollupAdapter::handle_advance(const std::string& payload_hex) {
    const matching::RequestResult result = processor_.handle_request(payload_hex);

    if (!result.is_notice()) {
        send_report(result.message);
        return FinishStatus::REJECT;
    }

    if (!send_notice(result.payload)) {
        return FinishStatus::REJECT;
    }
    if (!result.instrument_errors.empty()) {
        Json::Value errors(Json::arrayValue);
        for (const auto& error : result.instrument_errors) {
            errors.append(error);
        }
        Json::Value report;
        report["instrument_errors"] = errors;
        send_report(compact(report));
    }
    return FinishStatus::ACCEPT;
}

void RollupAdapter::handle_inspect() {
    send_report(compact(processor_.status()));
    next_status_ = FinishStatus::ACCEPT;
}

bool RollupAdapter::send_notice(const std::string& payload_hex) {
    Json::Value body;
    body["payload"] = payload_hex;
    HttpResponse response = post_json("/notice", body);
    if (!response.success) {
        LOG_ERROR_COMP(logging::components::ROLLUP_ADAPTER,
                       "Notice not accepted (status " + std::to_string(response.status_code) + ")");
        return false;
    }
    ++stats_.notices;
    return true;
}

void RollupAdapter::send_report(const std::string& message) {
    Json::Value body;
    body["payload"] = utf8_hex(message);
    HttpResponse response = post_json("/report", body);
    if (!response.success) {
        LOG_ERROR_COMP(logging::components::ROLLUP_ADAPTER,
                       "Report not accepted (status " + std::to_string(response.status_code) + ")");
        return;
    }
    ++stats_.reports;
}

} // namespace rollup
