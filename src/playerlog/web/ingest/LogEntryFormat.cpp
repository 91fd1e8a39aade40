#include <playerlog/web/ingest/LogEntryFormat.hpp>

#include <cctype>

namespace PL::Ingest {

namespace {

constexpr std::string_view kFieldIndent = "  ";
constexpr std::string_view kStackIndent = "    ";

auto trim_view(std::string_view value) -> std::string_view {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return value;
}

auto flag_text(std::optional<bool> const& flag) -> std::string_view {
    if (!flag) {
        return kUnknownField;
    }
    return *flag ? "true" : "false";
}

auto text_or_unknown(std::optional<std::string> const& value) -> std::string_view {
    return value ? std::string_view{*value} : kUnknownField;
}

void append_field(std::string& out, std::string_view label, std::string_view value) {
    out.append(kFieldIndent);
    out.append(label);
    out.append(": ");
    out.append(value);
    out.push_back('\n');
}

auto separator() -> std::string const& {
    static std::string const line(kSeparatorWidth, '-');
    return line;
}

auto malformed_at(std::size_t line_no, std::string_view what) -> PL::Error {
    return PL::Error{PL::Error::Code::MalformedInput,
                     "line " + std::to_string(line_no) + ": " + std::string{what}};
}

struct Header {
    std::string timestamp;
    std::string level;
    std::string message;
};

// "[timestamp] [LEVEL]" optionally followed by " message".
auto parse_header(std::string_view line) -> std::optional<Header> {
    if (line.size() < 2 || line.front() != '[') {
        return std::nullopt;
    }
    auto ts_end = line.find("] [");
    if (ts_end == std::string_view::npos) {
        return std::nullopt;
    }
    auto level_begin = ts_end + 3;
    auto level_end   = line.find(']', level_begin);
    if (level_end == std::string_view::npos) {
        return std::nullopt;
    }
    Header header;
    header.timestamp = std::string{line.substr(1, ts_end - 1)};
    header.level     = std::string{line.substr(level_begin, level_end - level_begin)};
    auto rest        = line.substr(level_end + 1);
    if (!rest.empty() && rest.front() == ' ') {
        rest.remove_prefix(1);
    }
    header.message = std::string{rest};
    return header;
}

} // namespace

auto FormatClientErrorEntry(ErrorRecord const& record, std::string_view client_ip) -> std::string {
    std::string out;
    out.reserve(256 + record.message.size());

    out.push_back('[');
    out.append(record.timestamp.value_or(std::string{}));
    out.append("] [");
    out.append(kClientErrorTag);
    out.append("]\n");

    append_field(out, FieldLabel::Source, record.source);
    append_field(out, FieldLabel::Context, record.context);
    append_field(out, FieldLabel::Message, record.message);
    append_field(out, FieldLabel::Url, text_or_unknown(record.page_url));
    append_field(out, FieldLabel::UserAgent, text_or_unknown(record.user_agent));
    append_field(out, FieldLabel::Dns, text_or_unknown(record.endpoint_dns));
    append_field(out, FieldLabel::Cors, flag_text(record.cors_enabled));
    append_field(out, FieldLabel::Https, flag_text(record.https_enabled));

    if (!record.stack_trace.empty()) {
        out.append(kFieldIndent);
        out.append(kStackTraceLabel);
        out.append(":\n");
        for (auto const& line : record.stack_trace) {
            out.append(kStackIndent);
            out.append(trim_view(line));
            out.push_back('\n');
        }
    }

    append_field(out, FieldLabel::Ip, client_ip);
    out.append(separator());
    out.push_back('\n');
    return out;
}

auto FormatEventLine(std::string_view timestamp, LogLevel level, std::string_view message)
    -> std::string {
    std::string out;
    out.reserve(timestamp.size() + message.size() + 16);
    out.push_back('[');
    out.append(timestamp);
    out.append("] [");
    out.append(to_string(level));
    out.append("] ");
    out.append(message);
    out.push_back('\n');
    return out;
}

auto ParsedLogEntry::field(std::string_view label) const -> std::optional<std::string> {
    for (auto const& [name, value] : fields) {
        if (name == label) {
            return value;
        }
    }
    return std::nullopt;
}

auto ParseLogEntries(std::string_view text) -> PL::Expected<std::vector<ParsedLogEntry>> {
    std::vector<ParsedLogEntry>   entries;
    std::optional<ParsedLogEntry> open_entry;
    bool                          in_stack = false;
    std::size_t                   line_no  = 0;

    while (!text.empty()) {
        auto newline = text.find('\n');
        auto line    = text.substr(0, newline);
        text.remove_prefix(newline == std::string_view::npos ? text.size() : newline + 1);
        ++line_no;

        if (!open_entry) {
            if (line.empty()) {
                continue;
            }
            auto header = parse_header(line);
            if (!header) {
                return std::unexpected(malformed_at(line_no, "expected an entry header"));
            }
            ParsedLogEntry entry{};
            entry.timestamp = std::move(header->timestamp);
            entry.level     = std::move(header->level);
            if (entry.is_client_error()) {
                open_entry = std::move(entry);
                in_stack   = false;
            } else {
                entry.message = std::move(header->message);
                entries.push_back(std::move(entry));
            }
            continue;
        }

        if (line == separator()) {
            entries.push_back(std::move(*open_entry));
            open_entry.reset();
            continue;
        }
        if (in_stack && line.starts_with(kStackIndent)) {
            open_entry->stack_trace.emplace_back(line.substr(kStackIndent.size()));
            continue;
        }
        if (!line.starts_with(kFieldIndent)) {
            return std::unexpected(malformed_at(line_no, "expected a labelled field"));
        }
        auto body = line.substr(kFieldIndent.size());
        if (body.size() == kStackTraceLabel.size() + 1 && body.starts_with(kStackTraceLabel)
            && body.back() == ':') {
            in_stack = true;
            continue;
        }
        auto colon = body.find(": ");
        if (colon == std::string_view::npos || colon == 0) {
            return std::unexpected(malformed_at(line_no, "expected 'Label: value'"));
        }
        in_stack = false;
        open_entry->fields.emplace_back(std::string{body.substr(0, colon)},
                                        std::string{body.substr(colon + 2)});
    }

    if (open_entry) {
        return std::unexpected(malformed_at(line_no, "entry is missing its separator"));
    }
    return entries;
}

} // namespace PL::Ingest
