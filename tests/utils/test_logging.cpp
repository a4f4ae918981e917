#include <catch2/catch_test_macros.hpp>

#include "helio-corr/utils/logging.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <thread>
#include <vector>

using heliocorr::utils::Logging;

TEST_CASE("Logging hands every thread the same logger on first use", "[utils][logging]") {
	constexpr std::size_t kThreads = 16;
	std::vector<spdlog::logger *> seen(kThreads, nullptr);
	std::vector<std::thread> workers;
	workers.reserve(kThreads);
	for (std::size_t i = 0; i < kThreads; ++i) {
		workers.emplace_back([&seen, i]() {
			HELIOCORR_DEBUG("worker {} logging", i);
			seen[i] = Logging::getLogger().get();
		});
	}
	for (auto &worker : workers) {
		worker.join();
	}

	REQUIRE(seen.front() != nullptr);
	for (const auto *logger : seen) {
		REQUIRE(logger == seen.front());
	}
	REQUIRE(spdlog::get("helio-corr").get() == seen.front());
}

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "helio-corr");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging reuses a logger registered under the library name", "[utils][logging]") {
	REQUIRE(spdlog::get("helio-corr") == Logging::getLogger());
}
