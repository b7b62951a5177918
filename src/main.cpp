#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options/errors.hpp>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include <ytproxy/access_guard.hpp>
#include <ytproxy/config.hpp>
#include <ytproxy/extractor.hpp>
#include <ytproxy/fallback_binary.hpp>
#include <ytproxy/http_client.hpp>
#include <ytproxy/stream_cache.hpp>
#include <ytproxy/stream_service.hpp>
#include <ytproxy/token_codec.hpp>
#include <ytproxy/tool_invoker.hpp>

#include "server/endpoints.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"

namespace po = boost::program_options;
namespace asio = boost::asio;

int main(int argc, char *argv[]) {
	try {
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

		ytproxy::ServerConfig cfg;
		try {
			cfg = ytproxy::load_config(argc, argv);
		} catch (const po::error &e) {
			spdlog::error("Invalid option: {}", e.what());
			return 1;
		} catch (const std::invalid_argument &e) {
			spdlog::error("Invalid configuration: {}", e.what());
			return 1;
		}

		if (cfg.help) {
			std::cout << "Usage: ytproxy-server [options]\n"
					  << ytproxy::config_options() << "\n";
			return 0;
		}

		spdlog::set_level(cfg.verbose ? spdlog::level::debug
									  : spdlog::level::info);

		if (!cfg.stream_secret) {
			spdlog::warn(
				"STREAM_PROXY_SECRET is not set: proxy URLs are unsigned and "
				"/api/youtube/proxy is open to anyone");
		}
		if (cfg.proxy.enabled()) {
			spdlog::info("Outbound proxy configured");
		}

		asio::io_context ioc(static_cast<int>(cfg.threads));
		auto ex = ioc.get_executor();

		// Extraction
		auto http = std::make_shared<ytproxy::net::HttpClient>(ex, cfg.proxy);
		auto invoker = std::make_shared<ytproxy::ProcessToolInvoker>(ex);

		ytproxy::youtube::FallbackOptions fallback_opts;
		fallback_opts.download_base_url = cfg.download_base_url;
		fallback_opts.cache_dir = cfg.cache_dir;
		fallback_opts.asset_name = ytproxy::youtube::platform_asset_name();
		fallback_opts.proxy_configured = cfg.proxy.enabled();
		auto fallback = std::make_shared<ytproxy::youtube::FallbackInstaller>(
			http, std::move(fallback_opts));

		ytproxy::youtube::ExtractionOptions extraction_opts;
		extraction_opts.primary_binary =
			ytproxy::ProcessToolInvoker::find_executable(cfg.ytdlp_path);
		extraction_opts.timeout = cfg.extraction_timeout;
		extraction_opts.proxy_url = cfg.proxy.url;
		extraction_opts.cookies_path = cfg.cookies_path;
		auto runner = std::make_shared<ytproxy::youtube::ExtractionRunner>(
			ex, invoker, fallback, std::move(extraction_opts));

		auto cache = std::make_shared<ytproxy::StreamCache>();
		cache->start_sweeper(ex);
		auto service = std::make_shared<ytproxy::StreamService>(runner, cache);

		// Access control
		std::shared_ptr<const ytproxy::auth::TokenCodec> codec;
		if (cfg.stream_secret) {
			codec = std::make_shared<const ytproxy::auth::TokenCodec>(
				*cfg.stream_secret, cfg.clock_skew);
		}

		ytproxy::auth::AccessOptions access_opts;
		access_opts.signing_secret_configured = cfg.stream_secret.has_value();
		access_opts.access_token = cfg.access_token;
		access_opts.jwt_secret = cfg.jwt_secret;
		auto guard =
			std::make_shared<const ytproxy::auth::AccessGuard>(access_opts);

		// HTTP surface
		ytproxy::server::StreamEndpointOptions stream_opts;
		stream_opts.token_ttl = cfg.token_ttl;
		stream_opts.port = cfg.port;
		stream_opts.cookies_configured = cfg.cookies_path.has_value();

		auto router = std::make_shared<ytproxy::server::Router>();
		ytproxy::server::register_routes(
			*router,
			std::make_shared<const ytproxy::server::StreamEndpoint>(
				service, codec, guard, stream_opts),
			std::make_shared<const ytproxy::server::ProxyEndpoint>(service, http,
																   codec),
			std::make_shared<const ytproxy::server::VideoInfoEndpoint>(service));

		ytproxy::server::HttpServer server(ex, router);
		if (auto listening = server.listen(cfg.bind_address, cfg.port);
			!listening) {
			spdlog::error("Cannot listen on {}:{}: {}", cfg.bind_address,
						  cfg.port, listening.error().message());
			return 1;
		}
		server.start();
		spdlog::info("{} {} listening on {}:{} ({} threads)",
					 ytproxy::kServiceName, ytproxy::kServiceVersion,
					 cfg.bind_address, cfg.port, cfg.threads);

		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (ec) return;
			spdlog::info("Received signal {}, shutting down", sig);
			server.stop();
			cache->stop_sweeper();
			ioc.stop();
		});

		std::vector<std::thread> workers;
		workers.reserve(cfg.threads - 1);
		for (unsigned i = 1; i < cfg.threads; ++i) {
			workers.emplace_back([&ioc] { ioc.run(); });
		}
		ioc.run();
		for (auto &t : workers) t.join();

		return 0;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return 1;
	}
}
