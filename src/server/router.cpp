#include "server/router.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <map>

#include "server/json_response.hpp"

namespace ytproxy::server {

namespace {

std::vector<std::string> split_path(std::string_view path) {
	std::vector<std::string> segments;
	std::size_t pos = 0;
	while (pos <= path.size()) {
		auto next = path.find('/', pos);
		if (next == std::string_view::npos) next = path.size();
		if (next > pos) segments.emplace_back(path.substr(pos, next - pos));
		pos = next + 1;
	}
	return segments;
}

bool match(const std::vector<std::string> &pattern,
		   const std::vector<std::string> &segments,
		   std::map<std::string, std::string, std::less<>> &params) {
	if (pattern.size() != segments.size()) return false;
	for (std::size_t i = 0; i < pattern.size(); ++i) {
		const auto &p = pattern[i];
		if (p.size() > 2 && p.front() == '{' && p.back() == '}') {
			params[p.substr(1, p.size() - 2)] = segments[i];
		} else if (p != segments[i]) {
			return false;
		}
	}
	return true;
}

std::string_view verb_name(http::verb method) {
	auto s = http::to_string(method);
	return {s.data(), s.size()};
}

// Decorates every response with CORS headers and remembers what was sent.
class TrackingResponder final : public Responder {
   public:
	enum class State { idle, streaming, done };

	explicit TrackingResponder(Responder &inner) : m_inner(inner) {}

	Result<void> send(http::response<http::string_body> res,
					  asio::yield_context yield) override {
		apply_cors(res);
		m_status = res.result_int();
		m_state = State::done;
		return m_inner.send(std::move(res), yield);
	}

	Result<void> begin_stream(http::response_header<> header,
							  asio::yield_context yield) override {
		apply_cors(header);
		m_status = header.result_int();
		m_state = State::streaming;
		return m_inner.begin_stream(std::move(header), yield);
	}

	Result<void> write_stream(asio::const_buffer data,
							  asio::yield_context yield) override {
		return m_inner.write_stream(data, yield);
	}

	Result<void> end_stream(asio::yield_context yield) override {
		m_state = State::done;
		return m_inner.end_stream(yield);
	}

	void abort() override {
		m_state = State::done;
		m_inner.abort();
	}

	[[nodiscard]] State state() const { return m_state; }
	[[nodiscard]] unsigned status() const { return m_status; }

   private:
	Responder &m_inner;
	State m_state = State::idle;
	unsigned m_status = 0;
};

}  // namespace

void apply_cors(http::fields &fields) {
	fields.set(http::field::access_control_allow_origin, "*");
	fields.set(http::field::access_control_allow_methods, "GET, OPTIONS");
	fields.set(http::field::access_control_allow_headers,
			   "Content-Type, Authorization, Range, X-Ytproxy-Stream-Token");
	fields.set(http::field::access_control_expose_headers,
			   "Content-Length, Content-Range, Accept-Ranges");
}

void Router::add(http::verb method, std::string pattern, Handler handler) {
	m_routes.push_back({method, split_path(pattern), std::move(handler)});
}

void Router::dispatch(HttpRequest request, Responder &responder,
					  asio::yield_context yield) const {
	const auto started = std::chrono::steady_clock::now();
	TrackingResponder out(responder);

	if (request.method() == http::verb::options) {
		http::response<http::string_body> res{http::status::no_content, 11};
		res.set(http::field::access_control_max_age, "86400");
		res.prepare_payload();
		reply(out, std::move(res), yield);
	} else {
		const auto segments = split_path(request.path());
		const Route *found = nullptr;
		bool path_known = false;
		std::map<std::string, std::string, std::less<>> params;

		for (const auto &route : m_routes) {
			std::map<std::string, std::string, std::less<>> captured;
			if (!match(route.segments, segments, captured)) continue;
			path_known = true;
			if (route.method != request.method()) continue;
			found = &route;
			params = std::move(captured);
			break;
		}

		if (found) {
			request.set_path_params(std::move(params));
			try {
				found->handler(request, out, yield);
			} catch (const std::exception &e) {
				spdlog::error("Handler for {} {} threw: {}",
							  verb_name(request.method()), request.path(),
							  e.what());
			}

			if (out.state() == TrackingResponder::State::idle) {
				reply(out,
					  json_error(http::status::internal_server_error,
								 "Internal Server Error"),
					  yield);
			} else if (out.state() == TrackingResponder::State::streaming) {
				out.abort();
			}
		} else if (path_known) {
			reply(out,
				  json_error(http::status::method_not_allowed,
							 "Method Not Allowed"),
				  yield);
		} else {
			reply(out, json_error(http::status::not_found, "Not Found"), yield);
		}
	}

	const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - started);
	spdlog::info("{} {} {} {}ms", verb_name(request.method()), request.path(),
				 out.status(), elapsed.count());
}

}  // namespace ytproxy::server
