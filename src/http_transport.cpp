#include "warden/http_transport.hpp"
#include "warden/candidate_resolver.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>
#include <functional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace warden
{
    namespace
    {
        using Request = http::request<http::string_body>;
        using Response = http::response<http::string_body>;

        struct ExchangeState
        {
            beast::error_code ec;
            std::string stage{"resolve"};
            bool done{false};

            void fail(beast::error_code error)
            {
                ec = error;
                done = true;
            }
        };

        std::string host_header(const Url &url)
        {
            std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
            const std::uint16_t default_port = url.is_https() ? 443 : 80;
            if (url.port != default_port)
                host += ":" + std::to_string(url.port);
            return host;
        }

        Request make_request(const Url &url, const std::string &body, const HttpRequestOptions &options)
        {
            std::string target = url.path.empty() ? "/" : url.path;
            Request req{http::verb::post, target, 11};
            req.set(http::field::host, host_header(url));
            req.set(http::field::user_agent, options.user_agent);
            req.set(http::field::content_type, "application/json");
            req.set(http::field::accept, "application/json");
            req.body() = body;
            req.prepare_payload();
            return req;
        }

        template <class Stream>
        void write_then_read(Stream &stream, Request &req, beast::flat_buffer &buffer, Response &res,
                             ExchangeState &state)
        {
            state.stage = "write";
            http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                if (ec)
                    return state.fail(ec);
                state.stage = "read";
                http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
                    state.fail(ec);
                });
            });
        }

        /** Drive the io_context to the deadline; cancel outstanding work on timeout. */
        Result<HttpResponse> complete(net::io_context &ioc,
                                      std::chrono::milliseconds timeout,
                                      const std::function<void()> &cancel,
                                      ExchangeState &state,
                                      Response &res,
                                      const std::string &url)
        {
            ioc.run_for(timeout);
            if (!state.done)
            {
                cancel();
                ioc.restart();
                ioc.run();
                return std::unexpected(WardenError::network(
                    "Timed out after " + std::to_string(timeout.count()) + "ms during " + state.stage + " for " + url));
            }
            if (state.ec)
            {
                return std::unexpected(WardenError::network(
                    state.stage + " failed for " + url + ": " + state.ec.message()));
            }
            return HttpResponse{res.result_int(), std::move(res.body())};
        }

        Result<HttpResponse> post_plain(const Url &url, const std::string &full_url, Request &req,
                                        const HttpRequestOptions &options)
        {
            net::io_context ioc;
            tcp::resolver resolver(ioc);
            beast::tcp_stream stream(ioc);
            beast::flat_buffer buffer;
            Response res;
            ExchangeState state;

            resolver.async_resolve(url.host, std::to_string(url.port),
                                   [&](beast::error_code ec, tcp::resolver::results_type results) {
                                       if (ec)
                                           return state.fail(ec);
                                       state.stage = "connect";
                                       stream.async_connect(results, [&](beast::error_code ec, tcp::endpoint) {
                                           if (ec)
                                               return state.fail(ec);
                                           write_then_read(stream, req, buffer, res, state);
                                       });
                                   });

            auto cancel = [&] {
                resolver.cancel();
                stream.cancel();
            };
            auto result = complete(ioc, options.timeout, cancel, state, res, full_url);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return result;
        }

        Result<HttpResponse> post_tls(const Url &url, const std::string &full_url, Request &req,
                                      const HttpRequestOptions &options)
        {
            net::io_context ioc;
            ssl::context ctx{ssl::context::tls_client};
            if (options.verify_tls)
            {
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(ssl::verify_peer);
            }
            else
            {
                ctx.set_verify_mode(ssl::verify_none);
            }

            tcp::resolver resolver(ioc);
            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
            {
                return std::unexpected(WardenError::network("Failed to set TLS SNI host for " + full_url));
            }
            if (options.verify_tls)
            {
                stream.set_verify_callback(ssl::host_name_verification(url.host));
            }

            beast::flat_buffer buffer;
            Response res;
            ExchangeState state;

            resolver.async_resolve(url.host, std::to_string(url.port),
                                   [&](beast::error_code ec, tcp::resolver::results_type results) {
                                       if (ec)
                                           return state.fail(ec);
                                       state.stage = "connect";
                                       beast::get_lowest_layer(stream).async_connect(
                                           results, [&](beast::error_code ec, tcp::endpoint) {
                                               if (ec)
                                                   return state.fail(ec);
                                               state.stage = "tls handshake";
                                               stream.async_handshake(ssl::stream_base::client, [&](beast::error_code ec) {
                                                   if (ec)
                                                       return state.fail(ec);
                                                   write_then_read(stream, req, buffer, res, state);
                                               });
                                           });
                                   });

            auto cancel = [&] {
                resolver.cancel();
                beast::get_lowest_layer(stream).cancel();
            };
            auto result = complete(ioc, options.timeout, cancel, state, res, full_url);

            beast::error_code ec;
            beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
            return result;
        }
    } // namespace

    Result<HttpResponse> BeastHttpTransport::post_json(const std::string &url,
                                                       const std::string &body,
                                                       const HttpRequestOptions &options)
    {
        auto parsed = parse_url(url);
        if (!parsed)
            return std::unexpected(WardenError::network(parsed.error().what()));
        if (parsed->scheme != "http" && parsed->scheme != "https")
            return std::unexpected(WardenError::network("Unsupported scheme for " + url));

        Request req = make_request(*parsed, body, options);
        try
        {
            if (parsed->is_https())
                return post_tls(*parsed, url, req, options);
            return post_plain(*parsed, url, req, options);
        }
        catch (const boost::system::system_error &e)
        {
            spdlog::debug("Transport exception for {}: {}", url, e.what());
            return std::unexpected(WardenError::network(e.what()));
        }
    }

} // namespace warden
