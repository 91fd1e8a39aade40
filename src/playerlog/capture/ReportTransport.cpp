#include <httplib.h>

#include <playerlog/capture/ReportTransport.hpp>

#include <utility>

namespace PL::Capture {

auto ParseEndpointUrl(std::string_view url) -> PL::Expected<EndpointUrl> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "endpoint URL needs a scheme: " + std::string{url}});
    }
    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "unsupported endpoint scheme: " + std::string{scheme}});
    }
    auto authority_begin = scheme_end + 3;
    auto path_begin      = url.find('/', authority_begin);
    auto authority       = url.substr(authority_begin,
                                path_begin == std::string_view::npos ? std::string_view::npos : path_begin - authority_begin);
    if (authority.empty()) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "endpoint URL has no host: " + std::string{url}});
    }
    EndpointUrl endpoint{};
    endpoint.scheme_host_port = std::string{url.substr(0, authority_begin + authority.size())};
    endpoint.path = path_begin == std::string_view::npos ? std::string{"/"} : std::string{url.substr(path_begin)};
    return endpoint;
}

HttpReportTransport::HttpReportTransport(EndpointUrl endpoint, std::unique_ptr<httplib::Client> client)
    : endpoint_(std::move(endpoint))
    , client_(std::move(client)) {}

HttpReportTransport::~HttpReportTransport() = default;

auto HttpReportTransport::Create(std::string_view url, std::chrono::milliseconds timeout)
    -> PL::Expected<std::unique_ptr<HttpReportTransport>> {
    auto endpoint = ParseEndpointUrl(url);
    if (!endpoint) {
        return std::unexpected(endpoint.error());
    }
    auto client = std::make_unique<httplib::Client>(endpoint->scheme_host_port);
    if (!client->is_valid()) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                     "cannot create HTTP client for " + endpoint->scheme_host_port});
    }
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);
    return std::unique_ptr<HttpReportTransport>(new HttpReportTransport(std::move(*endpoint), std::move(client)));
}

auto HttpReportTransport::send(std::string const& body) -> PL::Expected<void> {
    auto result = client_->Post(endpoint_.path, body, "application/json");
    if (!result) {
        return std::unexpected(Error{Error::Code::TransportFailure,
                                     endpoint_.scheme_host_port + endpoint_.path + ": "
                                         + httplib::to_string(result.error())});
    }
    if (result->status == 429) {
        return std::unexpected(Error{Error::Code::RateLimited, "endpoint rate limit exceeded"});
    }
    if (result->status != 200) {
        return std::unexpected(Error{Error::Code::TransportFailure,
                                     "endpoint answered HTTP " + std::to_string(result->status)});
    }
    return {};
}

} // namespace PL::Capture
