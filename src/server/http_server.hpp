#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/serializer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "server/responder.hpp"
#include "server/router.hpp"

namespace ytproxy::server {

namespace beast = boost::beast;
using tcp = asio::ip::tcp;

/// Responder over a Beast TCP stream.
class BeastResponder final : public Responder {
   public:
	static constexpr std::chrono::seconds kWriteTimeout{60};

	BeastResponder(beast::tcp_stream &stream, unsigned version,
				   bool keep_alive);

	Result<void> send(http::response<http::string_body> res,
					  asio::yield_context yield) override;
	Result<void> begin_stream(http::response_header<> header,
							  asio::yield_context yield) override;
	Result<void> write_stream(asio::const_buffer data,
							  asio::yield_context yield) override;
	Result<void> end_stream(asio::yield_context yield) override;
	void abort() override;

	/// Whether the connection can carry another request.
	[[nodiscard]] bool reusable() const { return m_keep_alive && !m_aborted; }

   private:
	beast::tcp_stream &m_stream;
	unsigned m_version;
	bool m_keep_alive;
	bool m_aborted = false;

	std::optional<http::response<http::buffer_body>> m_streamed;
	std::optional<http::response_serializer<http::buffer_body>> m_serializer;
};

class HttpServer {
   public:
	static constexpr std::chrono::seconds kReadTimeout{30};
	static constexpr std::uint64_t kMaxRequestBody = 1024 * 1024;

	HttpServer(asio::any_io_executor ex, std::shared_ptr<const Router> router);

	HttpServer(const HttpServer &) = delete;
	HttpServer &operator=(const HttpServer &) = delete;

	/// Opens, binds and listens. Fails with the socket error.
	Result<void> listen(const std::string &address, unsigned short port);

	/// Starts accepting connections on the server's executor.
	void start();

	/// Closes the acceptor. Sessions in progress run to completion.
	void stop();

	[[nodiscard]] tcp::endpoint local_endpoint() const;

   private:
	asio::any_io_executor m_ex;
	std::shared_ptr<const Router> m_router;
	tcp::acceptor m_acceptor;
};

}  // namespace ytproxy::server
