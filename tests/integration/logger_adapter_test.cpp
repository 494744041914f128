/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <tagcheck/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace tagcheck;
using namespace tagcheck::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

auto temp_log_directory() -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / "tagcheck_logger_test";
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

/**
 * @brief Starts the adapter and shuts it down on scope exit
 */
class running_logger {
public:
    explicit running_logger(const logger_config& config) : log_dir_(config.log_directory) {
        auto started = logger_adapter::initialize(config);
        REQUIRE(started.is_ok());
    }

    ~running_logger() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    running_logger(const running_logger&) = delete;
    running_logger& operator=(const running_logger&) = delete;

private:
    std::filesystem::path log_dir_;
};

auto quiet_config(log_level level = log_level::info) -> logger_config {
    logger_config config;
    config.log_directory = temp_log_directory();
    config.enable_console = false;
    config.enable_file = false;
    config.min_level = level;
    return config;
}

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("logger_adapter lifecycle", "[logger_adapter][init]") {
    SECTION("initialize then shutdown") {
        REQUIRE(logger_adapter::initialize(quiet_config()).is_ok());
        CHECK(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        CHECK_FALSE(logger_adapter::is_initialized());
    }

    SECTION("a second initialize is refused") {
        running_logger logger(quiet_config());

        auto again = logger_adapter::initialize(quiet_config(log_level::trace));
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::logging_already_started);
        CHECK_FALSE(logger_adapter::is_level_enabled(log_level::trace));
    }

    SECTION("shutdown without initialize") {
        logger_adapter::shutdown();
        CHECK_FALSE(logger_adapter::is_initialized());
    }

    SECTION("messages before initialize are dropped") {
        CHECK_FALSE(logger_adapter::is_level_enabled(log_level::fatal));
        logger_adapter::log(log_level::fatal, "dropped");
        logger_adapter::flush();
        CHECK_FALSE(logger_adapter::is_initialized());
    }
}

TEST_CASE("logger_adapter file output", "[logger_adapter][file]") {
    auto config = quiet_config();
    cleanup_temp_directory(config.log_directory);
    config.enable_file = true;
    config.async_mode = false;

    running_logger logger(config);

    CHECK(std::filesystem::is_directory(config.log_directory));
    logger_adapter::log(log_level::info, "Validated 'doc': 3 findings");
    logger_adapter::flush();
}

// =============================================================================
// Level Filtering
// =============================================================================

TEST_CASE("logger_adapter level threshold", "[logger_adapter][logging]") {
    SECTION("trace enables every level") {
        running_logger logger(quiet_config(log_level::trace));
        CHECK(logger_adapter::is_level_enabled(log_level::trace));
        CHECK(logger_adapter::is_level_enabled(log_level::fatal));
        CHECK_FALSE(logger_adapter::is_level_enabled(log_level::off));
    }

    SECTION("warn hides the levels below it") {
        running_logger logger(quiet_config(log_level::warn));
        CHECK_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        CHECK_FALSE(logger_adapter::is_level_enabled(log_level::info));
        CHECK(logger_adapter::is_level_enabled(log_level::warn));
        CHECK(logger_adapter::is_level_enabled(log_level::error));
    }

    SECTION("off disables everything") {
        running_logger logger(quiet_config(log_level::off));
        CHECK(logger_adapter::is_initialized());
        CHECK_FALSE(logger_adapter::is_level_enabled(log_level::fatal));
    }

    SECTION("shutdown disables every level") {
        REQUIRE(logger_adapter::initialize(quiet_config(log_level::trace)).is_ok());
        logger_adapter::shutdown();
        CHECK_FALSE(logger_adapter::is_level_enabled(log_level::error));
    }
}

TEST_CASE("log level names", "[logger_adapter]") {
    CHECK(std::string(to_string(log_level::trace)) == "trace");
    CHECK(std::string(to_string(log_level::warn)) == "warn");
    CHECK(std::string(to_string(log_level::off)) == "off");
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("logger_adapter concurrent logging", "[logger_adapter][concurrency]") {
    running_logger logger(quiet_config(log_level::debug));

    constexpr int thread_count = 4;
    constexpr int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < messages_per_thread; ++i) {
                logger_adapter::log(log_level::debug,
                                    "worker " + std::to_string(t) + " message " +
                                        std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    logger_adapter::flush();
    CHECK(logger_adapter::is_initialized());
}
