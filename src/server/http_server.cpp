#include "server/http_server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include "server/json_response.hpp"
#include "utils.hpp"

namespace ytproxy::server {

BeastResponder::BeastResponder(beast::tcp_stream &stream, unsigned version,
							   bool keep_alive)
	: m_stream(stream), m_version(version), m_keep_alive(keep_alive) {}

Result<void> BeastResponder::send(http::response<http::string_body> res,
								  asio::yield_context yield) {
	res.version(m_version);
	res.keep_alive(m_keep_alive);
	if (res.need_eof()) m_keep_alive = false;

	m_stream.expires_after(kWriteTimeout);
	boost::system::error_code ec;
	http::async_write(m_stream, res, yield[ec]);
	if (ec) {
		m_aborted = true;
		return outcome::failure(std::error_code(ec));
	}
	return outcome::success();
}

Result<void> BeastResponder::begin_stream(http::response_header<> header,
										  asio::yield_context yield) {
	m_streamed.emplace(std::move(header));
	auto &res = *m_streamed;
	res.version(m_version);
	res.keep_alive(m_keep_alive);
	if (res.count(http::field::content_length) == 0) {
		if (m_version >= 11) {
			res.chunked(true);
		} else {
			m_keep_alive = false;
			res.keep_alive(false);
		}
	}
	if (res.need_eof()) m_keep_alive = false;

	res.body().data = nullptr;
	res.body().more = true;
	m_serializer.emplace(res);

	m_stream.expires_after(kWriteTimeout);
	boost::system::error_code ec;
	http::async_write_header(m_stream, *m_serializer, yield[ec]);
	if (ec) {
		m_aborted = true;
		return outcome::failure(std::error_code(ec));
	}
	return outcome::success();
}

Result<void> BeastResponder::write_stream(asio::const_buffer data,
										  asio::yield_context yield) {
	if (!m_serializer) return outcome::failure(errc::request_failed);
	if (data.size() == 0) return outcome::success();

	auto &body = m_streamed->body();
	body.data = const_cast<void *>(data.data());
	body.size = data.size();
	body.more = true;

	m_stream.expires_after(kWriteTimeout);
	boost::system::error_code ec;
	http::async_write(m_stream, *m_serializer, yield[ec]);
	if (ec == http::error::need_buffer) ec = {};
	if (ec) {
		m_aborted = true;
		return outcome::failure(std::error_code(ec));
	}
	return outcome::success();
}

Result<void> BeastResponder::end_stream(asio::yield_context yield) {
	if (!m_serializer) return outcome::failure(errc::request_failed);

	auto &body = m_streamed->body();
	body.data = nullptr;
	body.size = 0;
	body.more = false;

	m_stream.expires_after(kWriteTimeout);
	boost::system::error_code ec;
	http::async_write(m_stream, *m_serializer, yield[ec]);

	m_serializer.reset();
	m_streamed.reset();

	if (ec) {
		m_aborted = true;
		return outcome::failure(std::error_code(ec));
	}
	return outcome::success();
}

void BeastResponder::abort() {
	m_aborted = true;
	boost::system::error_code ec;
	m_stream.socket().shutdown(tcp::socket::shutdown_both, ec);
	m_stream.close();
}

namespace {

void run_session(tcp::socket socket, const std::shared_ptr<const Router> &router,
				 asio::yield_context yield) {
	beast::tcp_stream stream(std::move(socket));
	beast::flat_buffer buffer;
	boost::system::error_code ec;

	for (;;) {
		http::request_parser<http::string_body> parser;
		parser.body_limit(HttpServer::kMaxRequestBody);

		stream.expires_after(HttpServer::kReadTimeout);
		http::async_read(stream, buffer, parser, yield[ec]);
		if (ec == http::error::end_of_stream) break;
		if (ec) {
			spdlog::debug("Read error: {}", ec.message());
			return;
		}

		auto message = parser.release();
		BeastResponder responder(stream, message.version(),
								 message.keep_alive());

		auto request = HttpRequest::parse(std::move(message));
		if (request) {
			router->dispatch(std::move(request).value(), responder, yield);
		} else {
			auto res = json_error(http::status::bad_request, "Bad Request");
			apply_cors(res);
			if (auto sent = responder.send(std::move(res), yield); !sent) {
				spdlog::debug("Write error: {}", sent.error().message());
			}
		}

		if (!responder.reusable()) break;
	}

	stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace

HttpServer::HttpServer(asio::any_io_executor ex,
					   std::shared_ptr<const Router> router)
	: m_ex(std::move(ex)), m_router(std::move(router)), m_acceptor(m_ex) {}

Result<void> HttpServer::listen(const std::string &address,
								unsigned short port) {
	boost::system::error_code ec;
	auto addr = asio::ip::make_address(address, ec);
	if (ec) return outcome::failure(std::error_code(ec));

	tcp::endpoint endpoint{addr, port};

	m_acceptor.open(endpoint.protocol(), ec);
	if (ec) return outcome::failure(std::error_code(ec));

	m_acceptor.set_option(asio::socket_base::reuse_address(true), ec);
	if (ec) return outcome::failure(std::error_code(ec));

	m_acceptor.bind(endpoint, ec);
	if (ec) return outcome::failure(std::error_code(ec));

	m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	if (ec) return outcome::failure(std::error_code(ec));

	return outcome::success();
}

void HttpServer::start() {
	asio::spawn(
		m_ex,
		[this](asio::yield_context yield) {
			for (;;) {
				boost::system::error_code ec;
				tcp::socket socket =
					m_acceptor.async_accept(asio::make_strand(m_ex), yield[ec]);
				if (ec == asio::error::operation_aborted) return;
				if (ec) {
					spdlog::warn("Accept error: {}", ec.message());
					continue;
				}

				auto session_ex = socket.get_executor();
				asio::spawn(
					session_ex,
					[router = m_router, socket = std::move(socket)](
						asio::yield_context session_yield) mutable {
						run_session(std::move(socket), router, session_yield);
					},
					utils::log_coroutine_exit);
			}
		},
		utils::log_coroutine_exit);
}

void HttpServer::stop() {
	boost::system::error_code ec;
	m_acceptor.close(ec);
	if (ec) spdlog::warn("Closing acceptor: {}", ec.message());
}

tcp::endpoint HttpServer::local_endpoint() const {
	boost::system::error_code ec;
	return m_acceptor.local_endpoint(ec);
}

}  // namespace ytproxy::server
