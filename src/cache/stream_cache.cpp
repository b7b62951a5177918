#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/steady_timer.hpp>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include <ytproxy/stream_cache.hpp>

namespace ytproxy {

struct StreamCache::Impl : std::enable_shared_from_this<Impl> {
	struct Waiter {
		ResolveHandler handler;
		CompletionExecutor ex;
	};

	Clock clock;
	std::chrono::seconds ttl;

	mutable std::shared_mutex records_mutex;
	std::unordered_map<std::string, ResolvedStream> records;

	// Lock order: flight_mutex may be held while taking records_mutex,
	// never the reverse.
	mutable std::mutex flight_mutex;
	std::unordered_map<std::string, std::vector<Waiter>> flights;

	std::mutex sweeper_mutex;
	std::optional<asio::steady_timer> sweeper;

	Impl(Clock c, std::chrono::seconds t) : clock(std::move(c)), ttl(t) {}

	[[nodiscard]] bool fresh(const ResolvedStream &record,
							 std::chrono::system_clock::time_point now) const {
		return now - record.resolved_at < ttl;
	}

	[[nodiscard]] std::optional<ResolvedStream> lookup(
		std::string_view key) const {
		std::shared_lock lock(records_mutex);
		auto it = records.find(std::string(key));
		if (it == records.end() || !fresh(it->second, clock())) {
			return std::nullopt;
		}
		return it->second;
	}

	static void deliver(ResolveHandler handler, CompletionExecutor ex,
						Result<ResolvedStream> res) {
		asio::dispatch(ex, [h = std::move(handler), res = std::move(res)]() mutable {
			h(std::move(res));
		});
	}

	void get_or_resolve(std::string key, const Resolver &resolver,
						ResolveHandler handler, CompletionExecutor ex) {
		if (auto hit = lookup(key)) {
			spdlog::debug("Stream cache hit for {}", key);
			return deliver(std::move(handler), std::move(ex), std::move(*hit));
		}

		std::optional<ResolvedStream> hit;
		bool leader = false;
		{
			std::lock_guard lock(flight_mutex);
			// A flight may have landed between the lookup and the lock
			hit = lookup(key);
			if (!hit) {
				auto [it, inserted] = flights.try_emplace(key);
				it->second.push_back({std::move(handler), std::move(ex)});
				leader = inserted;
			}
		}

		if (hit) {
			return deliver(std::move(handler), std::move(ex), std::move(*hit));
		}
		if (!leader) {
			spdlog::debug("Joining in-flight resolution for {}", key);
			return;
		}

		spdlog::info("Stream cache miss for {}, resolving", key);
		try {
			resolver(key, [self = shared_from_this(),
						   key](Result<ResolvedStream> res) mutable {
				self->complete(key, std::move(res));
			});
		} catch (const std::exception &e) {
			spdlog::error("Resolver for {} threw: {}", key, e.what());
			complete(key, outcome::failure(errc::extraction_failed));
		}
	}

	void complete(const std::string &key, Result<ResolvedStream> res) {
		if (res) {
			res.value().resolved_at = clock();
			std::unique_lock lock(records_mutex);
			records.insert_or_assign(key, res.value());
		} else {
			spdlog::warn("Resolution of {} failed: {}", key,
						 res.error().message());
		}

		std::vector<Waiter> waiters;
		{
			std::lock_guard lock(flight_mutex);
			auto it = flights.find(key);
			if (it != flights.end()) {
				waiters = std::move(it->second);
				flights.erase(it);
			}
		}

		for (auto &w : waiters) {
			deliver(std::move(w.handler), std::move(w.ex), res);
		}
	}

	std::size_t sweep() {
		const auto now = clock();
		std::unique_lock lock(records_mutex);
		return std::erase_if(records, [&](const auto &entry) {
			return !fresh(entry.second, now);
		});
	}

	// Requires sweeper_mutex
	void schedule_sweep(std::chrono::seconds interval) {
		sweeper->expires_after(interval);
		sweeper->async_wait([weak = weak_from_this(),
							 interval](const boost::system::error_code &ec) {
			if (ec) return;
			auto self = weak.lock();
			if (!self) return;

			if (auto removed = self->sweep(); removed > 0) {
				spdlog::debug("Swept {} expired stream records", removed);
			}

			std::lock_guard lock(self->sweeper_mutex);
			if (self->sweeper) self->schedule_sweep(interval);
		});
	}
};

StreamCache::StreamCache(Clock clock, std::chrono::seconds ttl)
	: m_impl(std::make_shared<Impl>(std::move(clock), ttl)) {}

StreamCache::~StreamCache() { stop_sweeper(); }

void StreamCache::async_get_or_resolve_impl(std::string video_id,
											Resolver resolver,
											ResolveHandler handler,
											CompletionExecutor handler_ex) {
	m_impl->get_or_resolve(std::move(video_id), resolver, std::move(handler),
						   std::move(handler_ex));
}

std::optional<ResolvedStream> StreamCache::find(std::string_view video_id) const {
	return m_impl->lookup(video_id);
}

std::size_t StreamCache::sweep() { return m_impl->sweep(); }

std::size_t StreamCache::size() const {
	std::shared_lock lock(m_impl->records_mutex);
	return m_impl->records.size();
}

std::size_t StreamCache::in_flight() const {
	std::lock_guard lock(m_impl->flight_mutex);
	return m_impl->flights.size();
}

void StreamCache::start_sweeper(asio::any_io_executor ex,
								std::chrono::seconds interval) {
	std::lock_guard lock(m_impl->sweeper_mutex);
	if (m_impl->sweeper) return;
	m_impl->sweeper.emplace(std::move(ex));
	m_impl->schedule_sweep(interval);
}

void StreamCache::stop_sweeper() {
	std::lock_guard lock(m_impl->sweeper_mutex);
	if (!m_impl->sweeper) return;
	m_impl->sweeper->cancel();
	m_impl->sweeper.reset();
}

}  // namespace ytproxy
