#pragma once

#include <ytproxy/ytproxy_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <ytproxy/result.hpp>
#include <ytproxy/types.hpp>

namespace ytproxy {

namespace asio = boost::asio;

/// In-memory video id -> ResolvedStream map with a freshness window and
/// single-flight resolution.
///
/// A record is fresh while `now - resolved_at < ttl`. A stale record is a
/// miss at lookup time; the periodic sweep only reclaims memory.
/// At most one resolver call is in flight per key, and every caller that
/// joined it receives that call's outcome.
class YTPROXY_EXPORT StreamCache {
   public:
	using CompletionExecutor = asio::any_completion_executor;
	using ResolveHandler =
		asio::any_completion_handler<void(Result<ResolvedStream>)>;
	using Resolver = std::function<void(std::string video_id, ResolveHandler)>;

	static constexpr std::chrono::seconds kDefaultTtl = std::chrono::hours(5);
	static constexpr std::chrono::seconds kSweepInterval = std::chrono::hours(1);

	StreamCache(const StreamCache &) = delete;
	StreamCache &operator=(const StreamCache &) = delete;
	~StreamCache();

	explicit StreamCache(Clock clock = system_clock(),
						 std::chrono::seconds ttl = kDefaultTtl);

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ResolvedStream>))
				  CompletionToken>
	auto async_get_or_resolve(std::string video_id, Resolver resolver,
							  CompletionToken &&token) {
		return asio::async_initiate<CompletionToken,
									void(Result<ResolvedStream>)>(
			[this, video_id = std::move(video_id),
			 resolver = std::move(resolver)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler);

				auto any_handler = ResolveHandler{
					std::forward<decltype(handler)>(handler)};

				async_get_or_resolve_impl(
					std::move(video_id), std::move(resolver),
					std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

	/// Fresh record for `video_id`, if any.
	[[nodiscard]] std::optional<ResolvedStream> find(
		std::string_view video_id) const;

	/// Drops stale records. Returns how many were removed.
	std::size_t sweep();

	[[nodiscard]] std::size_t size() const;
	[[nodiscard]] std::size_t in_flight() const;

	/// Runs sweep() every `interval` on `ex` until stop_sweeper().
	void start_sweeper(asio::any_io_executor ex,
					   std::chrono::seconds interval = kSweepInterval);
	void stop_sweeper();

   private:
	struct Impl;

	void async_get_or_resolve_impl(std::string video_id, Resolver resolver,
								   ResolveHandler handler,
								   CompletionExecutor handler_ex);

	std::shared_ptr<Impl> m_impl;
};

}  // namespace ytproxy
