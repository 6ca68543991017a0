#include "transport/beast_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "util/file_util.hpp"
#include "util/my_logging.hpp"

namespace apnsclient {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

std::string lower_copy(std::string out) {
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

} // namespace

ApnsResult<void> set_sni_host(SSL *ssl, const std::string &host) {
  ERR_clear_error();
  if (SSL_set_tlsext_host_name(ssl, host.c_str())) {
    return ApnsResult<void>::Ok();
  }
  auto stack = cryptutil::OpensslErrorStack::capture();
  return ApnsResult<void>::Err(Error(TlsFailure{
      stack.empty() ? fmt::format("cannot set SNI host name '{}'", host)
                    : stack.message()}));
}

BeastTransport::BeastTransport(bool verify_tls)
    : verify_tls_(verify_tls), ssl_ctx_(ssl::context::tls_client) {}

ApnsResult<std::shared_ptr<BeastTransport>>
BeastTransport::create(const ApnsClientConfig &config) {
  using ReturnType = ApnsResult<std::shared_ptr<BeastTransport>>;
  std::shared_ptr<BeastTransport> transport(
      new BeastTransport(config.verify_tls));
  auto &ctx = transport->ssl_ctx_;
  beast::error_code ec;

  if (config.verify_tls) {
    ctx.set_default_verify_paths(ec);
    if (ec) {
      BOOST_LOG_SEV(app_logger(), trivial::error)
          << "TLS verify path setup failed: " << ec.message();
      return ReturnType::Err(from_tls(ec));
    }
  }

  if (config.client_cert_path) {
    auto cert = fileutil::read_file(*config.client_cert_path);
    if (cert.is_err()) {
      return ReturnType::Err(cert.error());
    }
    ctx.use_certificate_chain(net::buffer(cert.value()), ec);
    if (ec) {
      return ReturnType::Err(from_tls(ec));
    }
    // A combined PEM carries the key next to the certificate.
    auto key = fileutil::read_file(
        config.client_key_path.value_or(*config.client_cert_path));
    if (key.is_err()) {
      return ReturnType::Err(key.error());
    }
    ctx.use_private_key(net::buffer(key.value()), ssl::context::pem, ec);
    if (ec) {
      return ReturnType::Err(from_tls(ec));
    }
  }
  return ReturnType::Ok(std::move(transport));
}

ApnsResult<GatewayReply>
BeastTransport::round_trip(const GatewayRequest &request,
                           std::chrono::milliseconds timeout) {
  using ReturnType = ApnsResult<GatewayReply>;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  // Each exchange owns its io_context so concurrent sends share nothing but
  // the immutable SSL context.
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);

  beast::error_code ec;
  bool done = false;
  // Runs the pending step until it completes or the deadline passes.
  auto wait = [&](auto &&cancel) {
    ioc.restart();
    ioc.run_until(deadline);
    if (done) {
      return true;
    }
    cancel();
    ioc.restart();
    ioc.run();
    return false;
  };
  auto close_socket = [&] { beast::get_lowest_layer(stream).close(); };
  auto fail_timeout = [&](const char *step) {
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "Gateway " << step << " to " << request.host << " timed out after "
        << timeout.count() << "ms";
    return ReturnType::Err(timed_out());
  };
  auto fail_connection = [&](const char *step) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Gateway " << step << " to " << request.host
        << " failed: " << ec.message();
    return ReturnType::Err(from_connection(ec));
  };
  auto fail_tls = [&](const char *step) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Gateway " << step << " with " << request.host
        << " failed: " << ec.message();
    return ReturnType::Err(from_tls(ec));
  };

  tcp::resolver::results_type endpoints;
  done = false;
  resolver.async_resolve(request.host, request.port,
                         [&](const beast::error_code &e,
                             tcp::resolver::results_type results) {
                           ec = e;
                           endpoints = std::move(results);
                           done = true;
                         });
  if (!wait([&] { resolver.cancel(); })) {
    return fail_timeout("resolve");
  }
  if (ec) {
    return fail_connection("resolve");
  }

  done = false;
  beast::get_lowest_layer(stream).async_connect(
      endpoints,
      [&](const beast::error_code &e, const tcp::endpoint &) {
        ec = e;
        done = true;
      });
  if (!wait(close_socket)) {
    return fail_timeout("connect");
  }
  if (ec) {
    return fail_connection("connect");
  }

  if (auto sni = set_sni_host(stream.native_handle(), request.host);
      sni.is_err()) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Gateway set_sni with " << request.host
        << " failed: " << sni.error().detail().value_or("");
    return ReturnType::Err(sni.error());
  }
  if (verify_tls_) {
    stream.set_verify_mode(ssl::verify_peer);
    stream.set_verify_callback(ssl::host_name_verification(request.host));
  } else {
    stream.set_verify_mode(ssl::verify_none);
  }

  done = false;
  stream.async_handshake(ssl::stream_base::client,
                         [&](const beast::error_code &e) {
                           ec = e;
                           done = true;
                         });
  if (!wait(close_socket)) {
    return fail_timeout("tls_handshake");
  }
  if (ec) {
    return fail_tls("tls_handshake");
  }

  http::request<http::string_body> req{http::verb::post, request.path, 11};
  req.set(http::field::host, request.host);
  req.set(http::field::user_agent,
          std::string("apns-client/") + BOOST_BEAST_VERSION_STRING);
  req.set(http::field::content_type, "application/json");
  for (const auto &[name, value] : request.headers) {
    req.set(name, value);
  }
  req.body() = request.body;
  req.prepare_payload();

  done = false;
  http::async_write(stream, req,
                    [&](const beast::error_code &e, std::size_t) {
                      ec = e;
                      done = true;
                    });
  if (!wait(close_socket)) {
    return fail_timeout("write");
  }
  if (ec) {
    return fail_connection("write");
  }

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  done = false;
  http::async_read(stream, buffer, res,
                   [&](const beast::error_code &e, std::size_t) {
                     ec = e;
                     done = true;
                   });
  if (!wait(close_socket)) {
    return fail_timeout("read");
  }
  if (ec) {
    return fail_connection("read");
  }

  GatewayReply reply;
  reply.status = static_cast<int>(res.result_int());
  for (const auto &field : res) {
    reply.headers[lower_copy(std::string(field.name_string()))] =
        std::string(field.value());
  }
  reply.body = std::move(res.body());

  beast::error_code close_ec;
  beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both,
                                                    close_ec);
  if (close_ec) {
    BOOST_LOG_SEV(app_logger(), trivial::trace)
        << "Gateway socket shutdown: " << close_ec.message();
  }
  return ReturnType::Ok(std::move(reply));
}

} // namespace apnsclient
