#pragma once

#include <ytproxy/ytproxy_export.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <memory>
#include <string>

#include "extractor.hpp"
#include "result.hpp"
#include "stream_cache.hpp"
#include "types.hpp"

namespace ytproxy {

namespace asio = boost::asio;

/// Builds the cache record for one extraction. `resolved_at` is left for
/// the cache to stamp.
YTPROXY_EXPORT ResolvedStream make_resolved_stream(
	const std::string &video_id, const ExtractionResult &info);

/// Front door for the HTTP handlers: extraction plus format selection,
/// memoised through a StreamCache.
class YTPROXY_EXPORT StreamService {
   public:
	StreamService(std::shared_ptr<youtube::ExtractionSource> source,
				  std::shared_ptr<StreamCache> cache);

	[[nodiscard]] asio::any_io_executor get_executor() const {
		return m_source->get_executor();
	}

	[[nodiscard]] StreamCache &cache() { return *m_cache; }

	/// Cached resolution of `video_id`. Concurrent calls for one id share a
	/// single extraction.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ResolvedStream>))
				  CompletionToken>
	auto async_resolve(std::string video_id, CompletionToken &&token) {
		return m_cache->async_get_or_resolve(
			std::move(video_id), make_resolver(),
			std::forward<CompletionToken>(token));
	}

	/// Full metadata for `video_id`. Not cached.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ExtractionResult>))
				  CompletionToken>
	auto async_describe(std::string video_id, CompletionToken &&token) {
		return m_source->async_extract(std::move(video_id),
									   std::forward<CompletionToken>(token));
	}

   private:
	[[nodiscard]] StreamCache::Resolver make_resolver() const;

	std::shared_ptr<youtube::ExtractionSource> m_source;
	std::shared_ptr<StreamCache> m_cache;
};

}  // namespace ytproxy
