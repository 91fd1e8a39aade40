#include <playerlog/web/ingest/ErrorRecord.hpp>

#include <playerlog/web/ingest/TimeUtils.hpp>

#include <cstdint>
#include <utility>

namespace PL::Ingest {

namespace {

using json = nlohmann::json;

constexpr std::string_view kInvalidDataFormat = "Invalid data format";

auto malformed() -> PL::Error {
    return PL::Error{PL::Error::Code::MalformedInput, std::string{kInvalidDataFormat}};
}

// Strings pass through; every other non-null value keeps its JSON text.
auto to_text(json const& value) -> std::string {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto find_present(json const& payload, char const* key) -> json const* {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

auto optional_text(json const& payload, char const* key) -> std::optional<std::string> {
    if (auto const* value = find_present(payload, key)) {
        return to_text(*value);
    }
    return std::nullopt;
}

auto truthy(json const& value) -> bool {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>() != 0;
    }
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() != 0;
    }
    if (value.is_number_float()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        auto const& text = value.get_ref<std::string const&>();
        return !text.empty() && text != "0";
    }
    if (value.is_array() || value.is_object()) {
        return !value.empty();
    }
    return false;
}

auto optional_flag(json const& payload, char const* key) -> std::optional<bool> {
    if (auto const* value = find_present(payload, key)) {
        return truthy(*value);
    }
    return std::nullopt;
}

} // namespace

auto SplitStackTrace(std::string_view stack) -> std::vector<std::string> {
    std::vector<std::string> lines;
    while (!stack.empty()) {
        auto newline = stack.find('\n');
        if (newline == std::string_view::npos) {
            lines.emplace_back(stack);
            break;
        }
        lines.emplace_back(stack.substr(0, newline));
        stack.remove_prefix(newline + 1);
    }
    return lines;
}

auto ParseErrorRecord(std::string_view body) -> PL::Expected<ErrorRecord> {
    auto payload = json::parse(body.begin(), body.end(), nullptr, false);
    if (payload.is_discarded()) {
        return std::unexpected(malformed());
    }
    return ParseErrorRecord(payload);
}

auto ParseErrorRecord(json const& payload) -> PL::Expected<ErrorRecord> {
    if (!payload.is_object()) {
        return std::unexpected(malformed());
    }

    auto const* message = find_present(payload, WireKey::Message);
    if (message == nullptr) {
        return std::unexpected(malformed());
    }

    ErrorRecord record{};
    record.message = to_text(*message);
    if (record.message.empty()) {
        return std::unexpected(malformed());
    }

    record.timestamp = optional_text(payload, WireKey::Timestamp);
    if (auto source = optional_text(payload, WireKey::Source)) {
        record.source = std::move(*source);
    }
    if (auto context = optional_text(payload, WireKey::Context)) {
        record.context = std::move(*context);
    }
    record.user_agent    = optional_text(payload, WireKey::UserAgent);
    record.page_url      = optional_text(payload, WireKey::Url);
    record.endpoint_dns  = optional_text(payload, WireKey::Dns);
    record.cors_enabled  = optional_flag(payload, WireKey::Cors);
    record.https_enabled = optional_flag(payload, WireKey::Https);

    if (auto const* stack = find_present(payload, WireKey::Stack)) {
        if (stack->is_array()) {
            for (auto const& line : *stack) {
                record.stack_trace.push_back(to_text(line));
            }
        } else {
            record.stack_trace = SplitStackTrace(to_text(*stack));
        }
    }

    return record;
}

auto ErrorRecordToJson(ErrorRecord const& record) -> json {
    json payload{{WireKey::Message, record.message},
                 {WireKey::Source, record.source},
                 {WireKey::Context, record.context}};
    if (record.timestamp) {
        payload[WireKey::Timestamp] = *record.timestamp;
    }
    if (record.user_agent) {
        payload[WireKey::UserAgent] = *record.user_agent;
    }
    if (record.page_url) {
        payload[WireKey::Url] = *record.page_url;
    }
    if (record.endpoint_dns) {
        payload[WireKey::Dns] = *record.endpoint_dns;
    }
    if (record.cors_enabled) {
        payload[WireKey::Cors] = *record.cors_enabled;
    }
    if (record.https_enabled) {
        payload[WireKey::Https] = *record.https_enabled;
    }
    if (!record.stack_trace.empty()) {
        std::string stack;
        for (std::size_t i = 0; i < record.stack_trace.size(); ++i) {
            if (i > 0) {
                stack.push_back('\n');
            }
            stack.append(record.stack_trace[i]);
        }
        payload[WireKey::Stack] = std::move(stack);
    }
    return payload;
}

void ResolveTimestamp(ErrorRecord& record, std::chrono::system_clock::time_point now) {
    if (!record.timestamp || record.timestamp->empty()) {
        record.timestamp = format_log_timestamp(now);
    }
}

} // namespace PL::Ingest
