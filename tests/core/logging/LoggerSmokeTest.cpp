#include <cassert>
#include <iostream>
#include <spdlog/spdlog.h>
#include "agrocache/core/logging/Logger.hpp"
#include "agrocache/core/cache/manager/CacheManager.hpp"

using namespace agrocache::core;

void testInitializeOnce() {
    std::cout << "Testing logger initialization...\n";

    logging::LoggerConfig config;
    config.logPath = "";
    config.level = "warn";
    auto first = logging::initialize(config);
    assert(first);
    assert(first->name() == logging::kLoggerName);
    assert(first->level() == spdlog::level::warn);
    assert(logging::get() == first);

    std::cout << "[OK] logger initialization test\n";
}

void testReinitializeAppliesLevel() {
    std::cout << "Testing logger re-initialization applies level...\n";

    logging::LoggerConfig config;
    config.logPath = "";
    config.level = "debug";
    auto second = logging::initialize(config);
    assert(second == logging::get());
    assert(second->level() == spdlog::level::debug);

    // Второй CacheManager переопределяет уровень общего логгера
    cache::CacheConfig cacheConfig;
    cacheConfig.storagePath = "";
    cacheConfig.logPath = "";
    cacheConfig.logLevel = "error";
    cache::DefaultCacheManager manager(cacheConfig);
    assert(logging::get()->level() == spdlog::level::err);

    std::cout << "[OK] logger re-initialization test\n";
}

int main() {
    try {
        testInitializeOnce();
        testReinitializeAppliesLevel();

        spdlog::shutdown();
        std::cout << "All logger tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
