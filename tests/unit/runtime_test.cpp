#include "runtime/runtime.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "runtime/signal_handler.hpp"

// Runtime starts a real HTTP server; see http_server_test.cpp for the TSAN note
#if defined(__SANITIZE_THREAD__)
#define ITEMVAULT_SKIP_RUNTIME_TESTS 1
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define ITEMVAULT_SKIP_RUNTIME_TESTS 1
#else
#define ITEMVAULT_SKIP_RUNTIME_TESTS 0
#endif
#else
#define ITEMVAULT_SKIP_RUNTIME_TESTS 0
#endif

#if !ITEMVAULT_SKIP_RUNTIME_TESTS

namespace fs = std::filesystem;
using namespace itemvault;
using namespace itemvault::runtime;

class RuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        SignalHandler::reset();
        config.http.port = 0;
        config.http.thread_pool_size = 2;
        temp_dir = fs::temp_directory_path() / "itemvault_runtime_test";
        fs::remove_all(temp_dir);
    }

    void TearDown() override {
        SignalHandler::reset();
        fs::remove_all(temp_dir);
    }

    ServiceConfig config;
    fs::path temp_dir;
};

TEST_F(RuntimeTest, MemoryBackendServesRequests) {
    Runtime runtime(config);
    std::string error;

    ASSERT_TRUE(runtime.initialize(error)) << error;
    EXPECT_GT(runtime.http_port(), 0);
    EXPECT_EQ(runtime.get_store().describe(), "memory:items");

    auto outcome = runtime.get_dispatcher().dispatch(http::Request{"POST", "/items", R"({"name": "Widget"})"});
    ASSERT_NE(outcome.item(), nullptr);
    EXPECT_TRUE(runtime.get_store().get(outcome.item()->id).ok());
}

TEST_F(RuntimeTest, FileBackendUsesConfiguredTable) {
    config.store.backend = StoreBackend::FILE;
    config.store.data_dir = temp_dir.string();
    config.store.table = "inventory";

    Runtime runtime(config);
    std::string error;

    ASSERT_TRUE(runtime.initialize(error)) << error;
    EXPECT_EQ(runtime.get_store().describe(), "file:" + (temp_dir / "inventory.json").string());
}

TEST_F(RuntimeTest, CorruptTableFileFailsInitialization) {
    fs::create_directories(temp_dir);
    {
        std::ofstream out(temp_dir / "items.json");
        out << "garbage";
    }
    config.store.backend = StoreBackend::FILE;
    config.store.data_dir = temp_dir.string();

    Runtime runtime(config);
    std::string error;

    EXPECT_FALSE(runtime.initialize(error));
    EXPECT_NE(error.find("Failed to open item store"), std::string::npos);
}

TEST_F(RuntimeTest, RunReturnsOnShutdownRequest) {
    Runtime runtime(config);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    SignalHandler::request_shutdown();
    runtime.run();

    EXPECT_TRUE(SignalHandler::is_shutdown_requested());
}

#else  // ITEMVAULT_SKIP_RUNTIME_TESTS
TEST(RuntimeTest, DISABLED_SkippedUnderThreadSanitizer) {
    GTEST_SKIP() << "Runtime tests disabled under ThreadSanitizer";
}

#endif  // !ITEMVAULT_SKIP_RUNTIME_TESTS
