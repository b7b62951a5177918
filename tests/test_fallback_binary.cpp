#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <ytproxy/fallback_binary.hpp>

#include "support/fakes.hpp"

using namespace ytproxy;
using namespace ytproxy::youtube;
using namespace ytproxy::testing;

namespace fs = std::filesystem;

namespace {

Result<void> write_file(const std::string &path) {
	std::ofstream out(path, std::ios::binary);
	if (!out) return outcome::failure(errc::file_open_failed);
	out << "#!/bin/sh\necho fallback\n";
	return outcome::success();
}

class FallbackInstallerTest : public ::testing::Test {
   protected:
	void SetUp() override {
		const auto *info =
			::testing::UnitTest::GetInstance()->current_test_info();
		m_dir = fs::temp_directory_path() /
				(std::string("ytproxy-fallback-") + info->name());
		fs::remove_all(m_dir);
		m_http = std::make_shared<FakeHttpFetcher>(m_ioc.get_executor());
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove_all(m_dir, ec);
	}

	FallbackOptions options(bool proxy_configured = false) const {
		FallbackOptions opts;
		opts.download_base_url = "https://downloads.example/releases/";
		opts.cache_dir = m_dir;
		opts.asset_name = "yt-dlp_linux";
		opts.proxy_configured = proxy_configured;
		return opts;
	}

	asio::io_context m_ioc;
	fs::path m_dir;
	std::shared_ptr<FakeHttpFetcher> m_http;
};

}  // namespace

TEST(FallbackDownloadUrlTest, TrimsTrailingSlashes) {
	EXPECT_EQ(fallback_download_url("https://h.example/dl//", "yt-dlp_linux"),
			  "https://h.example/dl/yt-dlp_linux");
	EXPECT_EQ(fallback_download_url("https://h.example/dl", "yt-dlp_macos"),
			  "https://h.example/dl/yt-dlp_macos");
}

TEST_F(FallbackInstallerTest, ConcurrentCallersShareOneDownload) {
	std::vector<std::string> urls;
	m_http->on_download = [&](const std::string &url, const std::string &path,
							  net::Route) {
		urls.push_back(url);
		return write_file(path);
	};
	FallbackInstaller installer(m_http, options());

	std::vector<std::string> paths;
	for (int i = 0; i < 4; ++i) {
		asio::spawn(
			m_ioc,
			[&](asio::yield_context yield) {
				auto res = installer.async_ensure(yield);
				ASSERT_TRUE(res);
				paths.push_back(res.value());
			},
			[](std::exception_ptr e) {
				if (e) std::rethrow_exception(e);
			});
	}
	m_ioc.run();

	EXPECT_EQ(m_http->download_calls.load(), 1);
	ASSERT_EQ(urls.size(), 1u);
	EXPECT_EQ(urls[0], "https://downloads.example/releases/yt-dlp_linux");

	ASSERT_EQ(paths.size(), 4u);
	const auto expected = (m_dir / "yt-dlp_linux").string();
	for (const auto &p : paths) EXPECT_EQ(p, expected);

	EXPECT_TRUE(fs::exists(expected));
	EXPECT_FALSE(fs::exists(expected + ".part"));
	const auto perms = fs::status(expected).permissions();
	EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
}

TEST_F(FallbackInstallerTest, ProxiedDownloadFallsBackToDirect) {
	m_http->on_download = [](const std::string &, const std::string &path,
							 net::Route route) -> Result<void> {
		if (route == net::Route::proxied) {
			return outcome::failure(errc::request_failed);
		}
		return write_file(path);
	};
	FallbackInstaller installer(m_http, options(true));

	run_coroutine(m_ioc, [&](asio::yield_context yield) {
		EXPECT_TRUE(installer.async_ensure(yield));
	});

	ASSERT_EQ(m_http->download_routes.size(), 2u);
	EXPECT_EQ(m_http->download_routes[0], net::Route::proxied);
	EXPECT_EQ(m_http->download_routes[1], net::Route::direct);
}

TEST_F(FallbackInstallerTest, WithoutProxyGoesDirectOnly) {
	m_http->on_download = [](const std::string &, const std::string &path,
							 net::Route) { return write_file(path); };
	FallbackInstaller installer(m_http, options(false));

	run_coroutine(m_ioc, [&](asio::yield_context yield) {
		EXPECT_TRUE(installer.async_ensure(yield));
	});

	ASSERT_EQ(m_http->download_routes.size(), 1u);
	EXPECT_EQ(m_http->download_routes[0], net::Route::direct);
}

TEST_F(FallbackInstallerTest, FailureIsForgotten) {
	bool fail = true;
	m_http->on_download = [&](const std::string &, const std::string &path,
							  net::Route) -> Result<void> {
		if (fail) {
			// Partial file left behind by an interrupted transfer
			EXPECT_TRUE(write_file(path));
			return outcome::failure(errc::http_error);
		}
		return write_file(path);
	};
	FallbackInstaller installer(m_http, options());

	run_coroutine(m_ioc, [&](asio::yield_context yield) {
		auto res = installer.async_ensure(yield);
		ASSERT_FALSE(res);
		EXPECT_EQ(res.error(), errc::download_failed);
	});
	EXPECT_FALSE(fs::exists(m_dir / "yt-dlp_linux.part"));
	EXPECT_FALSE(fs::exists(m_dir / "yt-dlp_linux"));

	fail = false;
	run_coroutine(m_ioc, [&](asio::yield_context yield) {
		EXPECT_TRUE(installer.async_ensure(yield));
	});
	EXPECT_EQ(m_http->download_calls.load(), 2);
}

TEST_F(FallbackInstallerTest, ReusesInstalledBinary) {
	fs::create_directories(m_dir);
	ASSERT_TRUE(write_file((m_dir / "yt-dlp_linux").string()));
	m_http->on_download = [](const std::string &, const std::string &,
							 net::Route) -> Result<void> {
		return outcome::failure(errc::request_failed);
	};
	FallbackInstaller installer(m_http, options());

	run_coroutine(m_ioc, [&](asio::yield_context yield) {
		auto res = installer.async_ensure(yield);
		ASSERT_TRUE(res);
		EXPECT_EQ(res.value(), (m_dir / "yt-dlp_linux").string());
	});
	EXPECT_EQ(m_http->download_calls.load(), 0);
}

TEST_F(FallbackInstallerTest, UnsupportedPlatform) {
	auto opts = options();
	opts.asset_name.reset();
	FallbackInstaller installer(m_http, opts);

	EXPECT_FALSE(installer.binary_path().has_value());
	run_coroutine(m_ioc, [&](asio::yield_context yield) {
		auto res = installer.async_ensure(yield);
		ASSERT_FALSE(res);
		EXPECT_EQ(res.error(), errc::unsupported_platform);
	});
	EXPECT_EQ(m_http->download_calls.load(), 0);
}
