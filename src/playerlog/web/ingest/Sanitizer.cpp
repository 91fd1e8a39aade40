#include <playerlog/web/ingest/Sanitizer.hpp>

#include <cctype>
#include <utility>

namespace PL::Ingest {

namespace {

bool opens_tag(char next) {
    return std::isalpha(static_cast<unsigned char>(next)) != 0 || next == '/' || next == '!'
           || next == '?';
}

void append_hex_escape(std::string& out, unsigned char ch) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    out.append("\\x");
    out.push_back(kHex[(ch >> 4) & 0x0F]);
    out.push_back(kHex[ch & 0x0F]);
}

void sanitize_in_place(std::string& value) {
    value = SanitizeText(value);
}

void sanitize_in_place(std::optional<std::string>& value) {
    if (value) {
        *value = SanitizeText(*value);
    }
}

// Stack lines are written trimmed, so surrounding whitespace (a CRLF's '\r'
// included) is dropped before it could be escaped into visible text.
auto trim_line(std::string_view line) -> std::string_view {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front())) != 0) {
        line.remove_prefix(1);
    }
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())) != 0) {
        line.remove_suffix(1);
    }
    return line;
}

} // namespace

auto StripTags(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        char const ch = text[i];
        if (ch != '<' || i + 1 >= text.size() || !opens_tag(text[i + 1])) {
            out.push_back(ch);
            ++i;
            continue;
        }

        if (text.substr(i, 4) == "<!--") {
            auto close = text.find("-->", i + 4);
            if (close == std::string_view::npos) {
                break;
            }
            i = close + 3;
            continue;
        }

        // Attribute values may contain '>', so quotes are tracked until the tag closes.
        std::size_t j     = i + 1;
        char        quote = 0;
        for (; j < text.size(); ++j) {
            char const c = text[j];
            if (quote != 0) {
                if (c == quote) {
                    quote = 0;
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                break;
            }
        }
        if (j >= text.size()) {
            break;
        }
        i = j + 1;
    }
    return out;
}

auto EscapeText(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (char ch : text) {
        switch (ch) {
        case '&':
            out.append("&amp;");
            break;
        case '<':
            out.append("&lt;");
            break;
        case '>':
            out.append("&gt;");
            break;
        case '"':
            out.append("&quot;");
            break;
        case '\'':
            out.append("&#039;");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.push_back('\t');
            break;
        default: {
            auto const byte = static_cast<unsigned char>(ch);
            if (byte < 0x20 || byte == 0x7F) {
                append_hex_escape(out, byte);
            } else {
                out.push_back(ch);
            }
            break;
        }
        }
    }
    return out;
}

auto SanitizeText(std::string_view text) -> std::string {
    return EscapeText(StripTags(text));
}

auto SanitizeTimestamp(std::string_view text) -> std::string {
    auto        clean = SanitizeText(text);
    std::string out;
    out.reserve(clean.size());
    for (char ch : clean) {
        if (ch == '[') {
            out.append("&#91;");
        } else if (ch == ']') {
            out.append("&#93;");
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

auto SanitizeRecord(ErrorRecord record) -> ErrorRecord {
    if (record.timestamp) {
        record.timestamp = SanitizeTimestamp(*record.timestamp);
    }
    sanitize_in_place(record.message);
    sanitize_in_place(record.source);
    sanitize_in_place(record.context);
    sanitize_in_place(record.user_agent);
    sanitize_in_place(record.page_url);
    sanitize_in_place(record.endpoint_dns);
    for (auto& line : record.stack_trace) {
        line = SanitizeText(trim_line(line));
    }
    return record;
}

} // namespace PL::Ingest
