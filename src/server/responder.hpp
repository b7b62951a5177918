#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <ytproxy/result.hpp>

namespace ytproxy::server {

namespace asio = boost::asio;
namespace http = boost::beast::http;

/// Write side of one request. A handler either calls send() once, or
/// begin_stream(), any number of write_stream() and end_stream().
class Responder {
   public:
	virtual ~Responder() = default;

	virtual Result<void> send(http::response<http::string_body> res,
							  asio::yield_context yield) = 0;

	/// Sends the header of a response whose body follows incrementally.
	/// Without a Content-Length the body is chunked.
	virtual Result<void> begin_stream(http::response_header<> header,
									  asio::yield_context yield) = 0;
	virtual Result<void> write_stream(asio::const_buffer data,
									  asio::yield_context yield) = 0;
	virtual Result<void> end_stream(asio::yield_context yield) = 0;

	/// Drops the connection. The response in progress is left incomplete.
	virtual void abort() = 0;
};

}  // namespace ytproxy::server
