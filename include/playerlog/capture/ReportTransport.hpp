#pragma once

#include <playerlog/core/Error.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace httplib {
class Client;
}

namespace PL::Capture {

// Carries one serialized report to the ingestion endpoint. Only the capture
// agent's worker thread calls send(), so implementations need not be thread-safe.
class ReportTransport {
public:
    virtual ~ReportTransport() = default;

    virtual auto send(std::string const& body) -> PL::Expected<void> = 0;
};

struct EndpointUrl {
    std::string scheme_host_port; // "http://host:port"
    std::string path;             // "/logger"
};

auto ParseEndpointUrl(std::string_view url) -> PL::Expected<EndpointUrl>;

class HttpReportTransport final : public ReportTransport {
public:
    static auto Create(std::string_view url, std::chrono::milliseconds timeout)
        -> PL::Expected<std::unique_ptr<HttpReportTransport>>;

    ~HttpReportTransport() override;

    auto send(std::string const& body) -> PL::Expected<void> override;

    auto endpoint() const -> EndpointUrl const& { return endpoint_; }

private:
    HttpReportTransport(EndpointUrl endpoint, std::unique_ptr<httplib::Client> client);

    EndpointUrl                      endpoint_;
    std::unique_ptr<httplib::Client> client_;
};

} // namespace PL::Capture
