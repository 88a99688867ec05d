// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "transport.hh"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace gqlc {
    namespace {
        struct ParsedUrl {
            bool secure = false;
            std::string host;
            std::string port;
            std::string target;
        };

        ParsedUrl parseUrl(std::string const& url) {
            ParsedUrl parsed;

            auto schemeEnd = url.find("://");
            if (schemeEnd == std::string::npos)
                throw std::invalid_argument("URL has no scheme: " + url);

            auto const scheme = url.substr(0, schemeEnd);
            if (scheme == "https")
                parsed.secure = true;
            else if (scheme != "http")
                throw std::invalid_argument("unsupported URL scheme: " + scheme);
            schemeEnd += 3;

            auto const pathStart = url.find('/', schemeEnd);
            std::string hostPort;
            if (pathStart == std::string::npos) {
                hostPort = url.substr(schemeEnd);
                parsed.target = "/";
            }
            else {
                hostPort = url.substr(schemeEnd, pathStart - schemeEnd);
                parsed.target = url.substr(pathStart);
            }

            auto const colon = hostPort.find(':');
            if (colon != std::string::npos) {
                parsed.host = hostPort.substr(0, colon);
                parsed.port = hostPort.substr(colon + 1);
            }
            else {
                parsed.host = hostPort;
                parsed.port = parsed.secure ? "443" : "80";
            }

            if (parsed.host.empty())
                throw std::invalid_argument("URL has no host: " + url);

            return parsed;
        }

        http::request<http::string_body> makeRequest(HttpRequest const& request, ParsedUrl const& url) {
            http::request<http::string_body> req{ http::verb::post, url.target, 11 };
            req.set(http::field::host, url.host);
            req.set(http::field::user_agent, "gqlc/" BOOST_BEAST_VERSION_STRING);
            req.set(http::field::content_type, request.contentType);
            req.set(http::field::accept, "application/json");
            for (auto const& [name, value] : request.headers)
                req.set(name, value);
            req.body() = request.body;
            req.prepare_payload();
            return req;
        }

        template <typename StreamT>
        HttpResponse exchange(StreamT& stream, http::request<http::string_body> const& req) {
            http::write(stream, req);

            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            http::read(stream, buffer, res);

            HttpResponse response;
            response.status = static_cast<int>(res.result_int());
            response.body = std::move(res.body());
            return response;
        }
    }

    HttpResponse httpPost(HttpRequest const& request) {
        auto const url = parseUrl(request.url);
        auto const req = makeRequest(request, url);

        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(url.host, url.port);

        if (!url.secure) {
            beast::tcp_stream stream(ioc);
            stream.connect(results);

            auto response = exchange(stream, req);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return response;
        }

        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

        // SNI, required by most virtual-hosted endpoints
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
        stream.set_verify_callback(ssl::host_name_verification(url.host));

        beast::get_lowest_layer(stream).connect(results);
        stream.handshake(ssl::stream_base::client);

        auto response = exchange(stream, req);

        // peers commonly close without a close_notify; the response is already read
        beast::error_code ec;
        stream.shutdown(ec);
        return response;
    }
}
