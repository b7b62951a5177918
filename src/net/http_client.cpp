#include <spdlog/spdlog.h>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <vector>
#include <ytproxy/http_client.hpp>

namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace ytproxy::net {

namespace {

constexpr std::size_t kReadBufferSize = 256 * 1024;
constexpr const char *kDefaultUserAgent = "ytproxy/1.0";

struct Endpoint {
	std::string scheme;
	std::string host;  // Address to resolve (no brackets)
	std::string port;
	std::string authority;	// Value for the Host header
	std::string target;		// origin-form request target
	bool tls = false;
};

template <typename StringView>
std::string to_string(const StringView &sv) {
	return std::string(sv.data(), sv.size());
}

Result<Endpoint> parse_endpoint(std::string_view url) {
	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) return outcome::failure(errc::invalid_url);
	boost::urls::url_view u = u_res.value();

	Endpoint ep;
	ep.scheme = to_string(u.scheme());
	if (ep.scheme != "http" && ep.scheme != "https") {
		return outcome::failure(errc::invalid_url);
	}
	ep.tls = ep.scheme == "https";
	ep.host = u.host_address();
	if (ep.host.empty()) return outcome::failure(errc::invalid_url);
	ep.port = to_string(u.port());
	if (ep.port.empty()) ep.port = ep.tls ? "443" : "80";
	ep.authority = to_string(u.encoded_host_and_port());

	ep.target = to_string(u.encoded_path());
	if (ep.target.empty()) ep.target = "/";
	if (u.has_query()) {
		ep.target += "?";
		ep.target += to_string(u.encoded_query());
	}
	return ep;
}

Result<std::string> resolve_location(std::string_view base,
									 std::string_view location) {
	auto base_res = boost::urls::parse_uri(base);
	auto ref_res = boost::urls::parse_uri_reference(location);
	if (base_res.has_error() || ref_res.has_error()) {
		return outcome::failure(errc::invalid_url);
	}
	boost::urls::url dest;
	auto r = boost::urls::resolve(base_res.value(), ref_res.value(), dest);
	if (r.has_error()) return outcome::failure(errc::invalid_url);
	return to_string(dest.buffer());
}

bool is_redirect(unsigned status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

// Plain TCP until a TLS layer is stacked on top of it.
struct Connection {
	explicit Connection(const asio::any_io_executor &ex) : tcp(ex) {}

	beast::tcp_stream tcp;
	std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
	beast::flat_buffer buffer;

	beast::tcp_stream &lowest() {
		return tls ? beast::get_lowest_layer(*tls) : tcp;
	}

	template <typename F>
	void visit(F &&f) {
		if (tls) {
			f(*tls);
		} else {
			f(tcp);
		}
	}
};

class UpstreamResponse final : public ResponseStream {
   public:
	UpstreamResponse(asio::any_io_executor ex,
					 std::chrono::steady_clock::duration io_timeout)
		: m_ex(ex), m_conn(ex), m_io_timeout(io_timeout) {
		m_parser.emplace();
		m_parser->body_limit(boost::none);
	}

	~UpstreamResponse() override { close(); }

	Connection &connection() { return m_conn; }
	http::response_parser<http::buffer_body> &parser() { return *m_parser; }

	[[nodiscard]] unsigned status() const override {
		return m_parser->get().result_int();
	}

	[[nodiscard]] const http::fields &headers() const override {
		return m_parser->get().base();
	}

	void cancel() override { close(); }

	[[nodiscard]] asio::any_io_executor get_executor() const override {
		return m_ex;
	}

   protected:
	void async_read_some_impl(
		asio::mutable_buffer buffer,
		asio::any_completion_handler<void(Result<std::size_t>)> handler,
		CompletionExecutor handler_ex) override {
		if (m_parser->is_done() || buffer.size() == 0) {
			return complete(std::move(handler), std::move(handler_ex),
							std::size_t{0});
		}
		if (m_closed) {
			return complete(std::move(handler), std::move(handler_ex),
							outcome::failure(errc::upstream_fetch_failed));
		}

		m_conn.lowest().expires_after(m_io_timeout);
		m_parser->get().body().data = buffer.data();
		m_parser->get().body().size = buffer.size();

		m_conn.visit([&](auto &stream) {
			http::async_read(
				stream, m_conn.buffer, *m_parser,
				[this, buffer, handler = std::move(handler),
				 handler_ex = std::move(handler_ex)](
					beast::error_code ec, std::size_t) mutable {
					on_read(ec, buffer, std::move(handler),
							std::move(handler_ex));
				});
		});
	}

   private:
	void on_read(beast::error_code ec, asio::mutable_buffer buffer,
				 asio::any_completion_handler<void(Result<std::size_t>)> handler,
				 CompletionExecutor handler_ex) {
		if (ec == http::error::need_buffer) ec = {};
		if (ec) {
			spdlog::debug("Upstream body read failed: {}", ec.message());
			return complete(std::move(handler), std::move(handler_ex),
							outcome::failure(errc::upstream_fetch_failed));
		}

		std::size_t bytes_read = buffer.size() - m_parser->get().body().size;
		if (bytes_read == 0 && !m_parser->is_done()) {
			// Only framing (chunk headers) was consumed
			return async_read_some_impl(
				buffer, std::move(handler), std::move(handler_ex));
		}
		complete(std::move(handler), std::move(handler_ex), bytes_read);
	}

	static void complete(
		asio::any_completion_handler<void(Result<std::size_t>)> handler,
		CompletionExecutor handler_ex, Result<std::size_t> res) {
		asio::dispatch(handler_ex, [h = std::move(handler), res]() mutable {
			h(res);
		});
	}

	void close() {
		if (m_closed) return;
		m_closed = true;
		beast::error_code ec;
		m_conn.lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
		m_conn.lowest().close();
	}

	asio::any_io_executor m_ex;
	Connection m_conn;
	std::chrono::steady_clock::duration m_io_timeout;
	std::optional<http::response_parser<http::buffer_body>> m_parser;
	bool m_closed = false;
};

}  // namespace

ProxySettings ProxySettings::from_environment() {
	ProxySettings settings;
	for (const char *name :
		 {"https_proxy", "HTTPS_PROXY", "http_proxy", "HTTP_PROXY"}) {
		const char *value = std::getenv(name);
		if (value && *value) {
			settings.url = value;
			break;
		}
	}
	return settings;
}

struct HttpClient::Impl {
	asio::any_io_executor ex;
	ssl::context ssl_ctx;
	std::optional<Endpoint> proxy;
	HttpTimeouts timeouts;

	Impl(asio::any_io_executor e, const ProxySettings &settings,
		 HttpTimeouts t)
		: ex(std::move(e)), ssl_ctx(ssl::context::tlsv12_client), timeouts(t) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);

		if (settings.url) {
			auto parsed = parse_endpoint(*settings.url);
			if (parsed && !parsed.value().tls) {
				proxy = std::move(parsed).value();
			} else {
				spdlog::warn(
					"Ignoring unsupported proxy URL '{}'", *settings.url);
			}
		}
	}
};

namespace {

// Drives one GET through resolve, connect, optional CONNECT tunnel, TLS
// handshake, write and header read, following redirects. The whole sequence
// runs under one deadline; cancel() ends it early with errc::timeout.
class OpenSession : public std::enable_shared_from_this<OpenSession> {
   public:
	using CompletionExecutor = HttpFetcher::CompletionExecutor;
	using Handler = asio::any_completion_handler<void(Result<ResponseStreamPtr>)>;

	OpenSession(std::shared_ptr<HttpClient::Impl> impl,
				asio::any_io_executor strand, UpstreamRequest request,
				Handler cb, CompletionExecutor handler_ex)
		: impl_(std::move(impl)),
		  strand_(std::move(strand)),
		  resolver_(strand_),
		  deadline_(strand_),
		  request_(std::move(request)),
		  url_(request_.url),
		  cb_(std::move(cb)),
		  handler_ex_(std::move(handler_ex)) {}

	void run(std::chrono::steady_clock::duration limit) {
		deadline_.expires_after(limit);
		deadline_.async_wait(
			[weak = weak_from_this()](beast::error_code ec) {
				if (ec) return;
				if (auto self = weak.lock()) self->cancel();
			});
		asio::dispatch(strand_, [self = shared_from_this()] { self->start(); });
	}

	// Must be called on the session's strand.
	void cancel() {
		if (done_ || cancelled_) return;
		cancelled_ = true;
		spdlog::debug("Opening {} timed out", request_.url);
		resolver_.cancel();
		if (response_) response_->cancel();
	}

   private:
	void start() {
		if (cancelled_) return post_result(outcome::failure(errc::timeout));

		auto ep = parse_endpoint(url_);
		if (!ep) return post_result(outcome::failure(ep.error()));
		ep_ = std::move(ep).value();

		response_ =
			std::make_unique<UpstreamResponse>(strand_, impl_->timeouts.io);
		via_proxy_ = request_.route == Route::proxied && impl_->proxy;

		const Endpoint &dest = via_proxy_ ? *impl_->proxy : ep_;
		resolver_.async_resolve(
			dest.host, dest.port,
			beast::bind_front_handler(
				&OpenSession::on_resolve, shared_from_this()));
	}

	void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
		if (ec) return fail(ec, "resolve");

		auto &tcp_stream = response_->connection().tcp;
		tcp_stream.expires_after(impl_->timeouts.io);
		tcp_stream.async_connect(
			results, beast::bind_front_handler(
						 &OpenSession::on_connect, shared_from_this()));
	}

	void on_connect(beast::error_code ec, const tcp::endpoint & /*unused*/) {
		if (ec) return fail(ec, "connect");

		if (via_proxy_ && ep_.tls) return send_tunnel_request();
		if (ep_.tls) return start_handshake();
		do_write();
	}

	void send_tunnel_request() {
		std::string authority = ep_.host + ":" + ep_.port;
		tunnel_req_ = {http::verb::connect, authority, 11};
		tunnel_req_.set(http::field::host, authority);
		tunnel_req_.set(http::field::user_agent, kDefaultUserAgent);

		http::async_write(response_->connection().tcp, tunnel_req_,
						  beast::bind_front_handler(&OpenSession::on_tunnel_write,
													shared_from_this()));
	}

	void on_tunnel_write(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "proxy write");

		tunnel_parser_.emplace();
		tunnel_parser_->skip(true);
		http::async_read_header(
			response_->connection().tcp, response_->connection().buffer,
			*tunnel_parser_,
			beast::bind_front_handler(
				&OpenSession::on_tunnel_established, shared_from_this()));
	}

	void on_tunnel_established(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "proxy read");

		auto status = tunnel_parser_->get().result_int();
		if (status != 200) {
			spdlog::warn("Proxy refused tunnel to {}: {}", ep_.host, status);
			return post_result(outcome::failure(errc::request_failed));
		}
		start_handshake();
	}

	void start_handshake() {
		auto &conn = response_->connection();
		conn.tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
			std::move(conn.tcp), impl_->ssl_ctx);
		boost::certify::set_server_hostname(*conn.tls, ep_.host);

		conn.lowest().expires_after(impl_->timeouts.io);
		conn.tls->async_handshake(
			ssl::stream_base::client,
			beast::bind_front_handler(
				&OpenSession::on_handshake, shared_from_this()));
	}

	void on_handshake(beast::error_code ec) {
		if (ec) return fail(ec, "handshake");
		do_write();
	}

	void do_write() {
		// Plain-HTTP requests through a proxy use the absolute-form target
		const std::string &target =
			(via_proxy_ && !ep_.tls) ? url_ : ep_.target;

		req_ = {};
		req_.version(11);
		req_.method(http::verb::get);
		req_.target(target);
		req_.set(http::field::host, ep_.authority);
		req_.set(http::field::user_agent, kDefaultUserAgent);
		req_.set(http::field::accept, "*/*");
		for (const auto &field : request_.headers) {
			req_.set(field.name_string(), field.value());
		}

		auto &conn = response_->connection();
		conn.lowest().expires_after(impl_->timeouts.io);
		conn.visit([&](auto &stream) {
			http::async_write(stream, req_,
							  beast::bind_front_handler(
								  &OpenSession::on_write, shared_from_this()));
		});
	}

	void on_write(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "write");

		auto &conn = response_->connection();
		conn.visit([&](auto &stream) {
			http::async_read_header(
				stream, conn.buffer, response_->parser(),
				beast::bind_front_handler(
					&OpenSession::on_read_header, shared_from_this()));
		});
	}

	void on_read_header(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "read_header");

		const auto &res = response_->parser().get();
		auto status = res.result_int();
		auto location = res.find(http::field::location);

		if (is_redirect(status) && location != res.end()) {
			if (++redirects_ > HttpClient::kMaxRedirects) {
				spdlog::warn("Too many redirects fetching {}", request_.url);
				return post_result(outcome::failure(errc::http_error));
			}
			auto next = resolve_location(url_, to_string(location->value()));
			if (!next) return post_result(outcome::failure(next.error()));

			spdlog::debug("Following {} redirect", status);
			response_->cancel();
			url_ = std::move(next).value();
			return start();
		}

		ResponseStreamPtr stream = std::move(response_);
		post_result(std::move(stream));
	}

	void fail(beast::error_code ec, const char *what) {
		if (cancelled_) return post_result(outcome::failure(errc::timeout));
		spdlog::debug("Upstream {} failed for {}: {}", what, ep_.host,
					  ec.message());
		post_result(outcome::failure(errc::request_failed));
	}

	void post_result(Result<ResponseStreamPtr> res) {
		if (done_) return;
		done_ = true;
		deadline_.cancel();
		asio::dispatch(
			handler_ex_, [cb = std::move(cb_), res = std::move(res)]() mutable {
				cb(std::move(res));
			});
	}

	std::shared_ptr<HttpClient::Impl> impl_;
	asio::any_io_executor strand_;
	tcp::resolver resolver_;
	asio::steady_timer deadline_;
	UpstreamRequest request_;
	std::string url_;
	Handler cb_;
	CompletionExecutor handler_ex_;

	Endpoint ep_;
	bool via_proxy_ = false;
	bool cancelled_ = false;
	bool done_ = false;
	int redirects_ = 0;
	std::unique_ptr<UpstreamResponse> response_;
	http::request<http::empty_body> req_;
	http::request<http::empty_body> tunnel_req_;
	std::optional<http::response_parser<http::empty_body>> tunnel_parser_;
};

class DownloadSession : public std::enable_shared_from_this<DownloadSession> {
   public:
	using CompletionExecutor = HttpFetcher::CompletionExecutor;

	DownloadSession(std::shared_ptr<HttpClient::Impl> impl, std::string url,
					std::string output_path, Route route,
					asio::any_completion_handler<void(Result<void>)> cb,
					CompletionExecutor handler_ex)
		: impl_(std::move(impl)),
		  strand_(asio::make_strand(impl_->ex)),
		  timer_(strand_),
		  url_(std::move(url)),
		  output_path_(std::move(output_path)),
		  route_(route),
		  cb_(std::move(cb)),
		  handler_ex_(std::move(handler_ex)) {}

	void run() {
		timer_.expires_after(impl_->timeouts.download);
		timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
			if (ec) return;
			self->timed_out_ = true;
			spdlog::warn("Download of {} timed out", self->url_);
			if (auto open = self->open_.lock()) open->cancel();
			if (self->stream_) self->stream_->cancel();
		});

		auto open_handler = asio::bind_executor(
			strand_, [self = shared_from_this()](
						 Result<ResponseStreamPtr> res) mutable {
				self->on_open(std::move(res));
			});
		auto open = std::make_shared<OpenSession>(
			impl_, strand_, UpstreamRequest{url_, {}, route_},
			std::move(open_handler), strand_);
		open_ = open;
		open->run(std::min(impl_->timeouts.open, impl_->timeouts.download));
	}

   private:
	void on_open(Result<ResponseStreamPtr> res) {
		if (timed_out_) return finish(outcome::failure(errc::timeout));
		if (!res) return finish(outcome::failure(res.error()));
		stream_ = std::move(res).value();

		if (stream_->status() != 200) {
			spdlog::warn(
				"Download of {} failed with status {}", url_, stream_->status());
			return finish(outcome::failure(errc::http_error));
		}

		outfile_.open(output_path_, std::ios::binary | std::ios::trunc);
		if (!outfile_.is_open()) {
			return finish(outcome::failure(errc::file_open_failed));
		}
		read_next();
	}

	void read_next() {
		stream_->async_read_some(
			asio::buffer(buf_),
			asio::bind_executor(
				strand_, [self = shared_from_this()](Result<std::size_t> n) {
					self->on_read(n);
				}));
	}

	void on_read(Result<std::size_t> n) {
		if (timed_out_) return finish(outcome::failure(errc::timeout));
		if (!n) return finish(outcome::failure(n.error()));

		if (n.value() == 0) {
			outfile_.close();
			if (!outfile_) {
				return finish(outcome::failure(errc::file_write_failed));
			}
			return finish(outcome::success());
		}

		outfile_.write(buf_.data(), static_cast<std::streamsize>(n.value()));
		if (!outfile_) {
			return finish(outcome::failure(errc::file_write_failed));
		}
		read_next();
	}

	void finish(Result<void> res) {
		timer_.cancel();
		if (stream_) stream_->cancel();
		if (outfile_.is_open()) outfile_.close();
		asio::dispatch(
			handler_ex_, [cb = std::move(cb_), res]() mutable { cb(res); });
	}

	std::shared_ptr<HttpClient::Impl> impl_;
	asio::any_io_executor strand_;
	asio::steady_timer timer_;
	std::string url_;
	std::string output_path_;
	Route route_;
	asio::any_completion_handler<void(Result<void>)> cb_;
	CompletionExecutor handler_ex_;

	std::weak_ptr<OpenSession> open_;
	ResponseStreamPtr stream_;
	std::ofstream outfile_;
	std::vector<char> buf_ = std::vector<char>(kReadBufferSize);
	bool timed_out_ = false;
};

}  // namespace

HttpClient::HttpClient(asio::any_io_executor ex, ProxySettings proxy,
					   HttpTimeouts timeouts)
	: m_impl(std::make_shared<Impl>(std::move(ex), proxy, timeouts)) {}

HttpClient::~HttpClient() = default;

asio::any_io_executor HttpClient::get_executor() const { return m_impl->ex; }

void HttpClient::async_open_impl(
	UpstreamRequest request,
	asio::any_completion_handler<void(Result<ResponseStreamPtr>)> handler,
	CompletionExecutor handler_ex) {
	std::make_shared<OpenSession>(m_impl, asio::make_strand(m_impl->ex),
								  std::move(request), std::move(handler),
								  std::move(handler_ex))
		->run(m_impl->timeouts.open);
}

void HttpClient::async_download_file_impl(
	std::string url, std::string output_path, Route route,
	asio::any_completion_handler<void(Result<void>)> handler,
	CompletionExecutor handler_ex) {
	std::make_shared<DownloadSession>(m_impl, std::move(url),
									  std::move(output_path), route,
									  std::move(handler), std::move(handler_ex))
		->run();
}

}  // namespace ytproxy::net
