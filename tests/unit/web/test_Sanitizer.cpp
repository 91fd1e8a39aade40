#include <doctest/doctest.h>
#include <playerlog/web/ingest/Sanitizer.hpp>

#include <string>

using namespace PL::Ingest;

TEST_CASE("Sanitizer removes script markup and keeps surrounding text") {
    auto clean = SanitizeText("<script>alert(1)</script> hello");
    CHECK(clean.find("<script") == std::string::npos);
    CHECK(clean.find("</script") == std::string::npos);
    CHECK(clean.find('<') == std::string::npos);
    CHECK(clean.find("hello") != std::string::npos);
    CHECK(clean == "alert(1) hello");
}

TEST_CASE("StripTags handles attributes, comments and stray angle brackets") {
    CHECK(StripTags("<img src=x onerror=\"a>b\">pic") == "pic");
    CHECK(StripTags("a<!-- hidden -->b") == "ab");
    CHECK(StripTags("<?php echo 1; ?>x") == "x");
    CHECK(StripTags("1 < 2 and 3 > 2") == "1 < 2 and 3 > 2");
    CHECK(StripTags("cut <b unterminated") == "cut ");
    CHECK(StripTags("trailing <") == "trailing <");
}

TEST_CASE("EscapeText escapes HTML specials and quotes") {
    CHECK(EscapeText("a & b") == "a &amp; b");
    CHECK(EscapeText("1 < 2 > 0") == "1 &lt; 2 &gt; 0");
    CHECK(EscapeText("\"quoted\" 'single'") == "&quot;quoted&quot; &#039;single&#039;");
}

TEST_CASE("EscapeText keeps a value on one log line") {
    auto escaped = EscapeText("line one\nline two\r\n\x01" "end");
    CHECK(escaped.find('\n') == std::string::npos);
    CHECK(escaped.find('\r') == std::string::npos);
    CHECK(escaped == "line one\\nline two\\r\\n\\x01end");
    CHECK(EscapeText("tab\there") == "tab\there");
}

TEST_CASE("SanitizeRecord covers every string field and each stack line") {
    ErrorRecord record{};
    record.timestamp    = "<b>11/01/2026</b>";
    record.message      = "<i>boom</i> & more";
    record.source       = "<script>x</script>app.js";
    record.context      = "render\n[INJECTED] [CLIENT ERROR]";
    record.user_agent   = "Agent \"quoted\"";
    record.page_url     = "https://example.test/?q=<a>";
    record.endpoint_dns = "<u>dns</u>";
    record.stack_trace  = {"  at <anonymous> (app.js:1:2)\r", "<div>frame</div>"};

    auto clean = SanitizeRecord(record);
    CHECK(clean.timestamp == "11/01/2026");
    CHECK(clean.message == "boom &amp; more");
    CHECK(clean.source == "xapp.js");
    CHECK(clean.context == "render\\n[INJECTED] [CLIENT ERROR]");
    CHECK(clean.user_agent == "Agent &quot;quoted&quot;");
    CHECK(clean.page_url == "https://example.test/?q=");
    CHECK(clean.endpoint_dns == "dns");
    REQUIRE(clean.stack_trace.size() == 2);
    CHECK(clean.stack_trace[0] == "at  (app.js:1:2)");
    CHECK(clean.stack_trace[1] == "frame");
}

TEST_CASE("SanitizeTimestamp cannot close the entry header") {
    CHECK(SanitizeTimestamp("x] [INFO") == "x&#93; &#91;INFO");
    CHECK(SanitizeTimestamp("11/01/2026, 10:15:00") == "11/01/2026, 10:15:00");

    ErrorRecord record{};
    record.message   = "boom";
    record.timestamp = "[01/01/2026] [WARNING";
    auto clean       = SanitizeRecord(record);
    REQUIRE(clean.timestamp.has_value());
    CHECK(clean.timestamp->find('[') == std::string::npos);
    CHECK(clean.timestamp->find(']') == std::string::npos);
}

TEST_CASE("SanitizeRecord leaves absent fields absent") {
    ErrorRecord record{};
    record.message = "plain";
    auto clean     = SanitizeRecord(record);
    CHECK_FALSE(clean.timestamp.has_value());
    CHECK_FALSE(clean.user_agent.has_value());
    CHECK_FALSE(clean.cors_enabled.has_value());
    CHECK(clean.source == "Unknown");
    CHECK(clean.context == "General");
}
