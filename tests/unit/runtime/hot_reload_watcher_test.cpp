#include <gtest/gtest.h>

#include "../../common/stub_engine.h"
#include "../../common/test_helpers.h"
#include <dlinkwm/runtime/host_method_registry.h>
#include <dlinkwm/runtime/hot_reload_watcher.h>
#include <dlinkwm/runtime/module_cache.h>

using namespace dlinkwm;
using namespace dlinkwm::runtime;
using namespace std::chrono_literals;

namespace {

class HotReloadWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<tests::StubEngine>();
        cache = std::make_unique<ModuleCache>(engine, registry);
        modulePath = tests::write_file(dir / "mods" / "m.wasm",
                                       "stub-module\nexport answer i32 1\n");
    }

    HotReloadWatcher::Options options() const {
        HotReloadWatcher::Options o;
        o.watchDir = dir.path() / "mods";
        o.pollInterval = 10ms;
        return o;
    }

    int32_t answer() {
        auto handle = cache->getOrLoad(modulePath);
        if (!handle)
            return -1;
        return handle.value()->withExclusive([](IGuestInstance& inst) {
            auto r = inst.callI32Export("answer");
            return r ? r.value() : -1;
        });
    }

    tests::TempDir dir;
    HostMethodRegistry registry;
    std::shared_ptr<tests::StubEngine> engine;
    std::unique_ptr<ModuleCache> cache;
    std::filesystem::path modulePath;
};

} // namespace

TEST_F(HotReloadWatcherTest, MissingDirectoryFailsSynchronously) {
    auto opts = options();
    opts.watchDir = dir.path() / "does-not-exist";
    HotReloadWatcher watcher(*cache, opts);
    auto handle = watcher.start();
    ASSERT_FALSE(handle);
    EXPECT_EQ(handle.error().code, ErrorCode::IoError);
}

TEST_F(HotReloadWatcherTest, ModifiedModuleIsHotReloaded) {
    ASSERT_EQ(answer(), 1);
    const auto generation = cache->getOrLoad(modulePath).value()->generation();

    HotReloadWatcher watcher(*cache, options());
    auto handle = watcher.start();
    ASSERT_TRUE(handle) << handle.error().message;

    tests::touch_with(modulePath, "stub-module\nexport answer i32 2\n");
    ASSERT_TRUE(tests::wait_for([&] { return watcher.stats().reloads >= 1; }));

    auto current = cache->getOrLoad(modulePath);
    ASSERT_TRUE(current);
    EXPECT_GT(current.value()->generation(), generation);
    EXPECT_EQ(answer(), 2);
}

TEST_F(HotReloadWatcherTest, OtherExtensionsAreIgnored) {
    HotReloadWatcher watcher(*cache, options());
    auto handle = watcher.start();
    ASSERT_TRUE(handle);

    auto other = tests::write_file(dir / "mods" / "notes.txt", "a");
    tests::touch_with(other, "b");
    const auto scans = handle.value()->scans();
    ASSERT_TRUE(tests::wait_for([&] { return handle.value()->scans() >= scans + 3; }));
    EXPECT_EQ(watcher.stats().reloads, 0u);
    EXPECT_EQ(watcher.stats().failedReloads, 0u);
    EXPECT_EQ(engine->compiles(), 0);
}

TEST_F(HotReloadWatcherTest, BrokenModuleIsLoggedAndWatchingContinues) {
    ASSERT_EQ(answer(), 1);
    HotReloadWatcher watcher(*cache, options());
    auto handle = watcher.start();
    ASSERT_TRUE(handle);

    tests::touch_with(modulePath, "garbage");
    ASSERT_TRUE(tests::wait_for([&] { return watcher.stats().failedReloads >= 1; }));
    EXPECT_TRUE(handle.value()->running());

    tests::touch_with(modulePath, "stub-module\nexport answer i32 3\n");
    ASSERT_TRUE(tests::wait_for([&] { return watcher.stats().reloads >= 1; }));
    EXPECT_EQ(answer(), 3);
}

TEST_F(HotReloadWatcherTest, RemovedModuleIsInvalidated) {
    ASSERT_EQ(answer(), 1);
    HotReloadWatcher watcher(*cache, options());
    auto handle = watcher.start();
    ASSERT_TRUE(handle);

    std::filesystem::remove(modulePath);
    ASSERT_TRUE(tests::wait_for([&] { return watcher.stats().invalidations >= 1; }));
    EXPECT_FALSE(cache->containsModule(modulePath));
    EXPECT_FALSE(cache->containsInstance(modulePath));
}

TEST_F(HotReloadWatcherTest, NestedDirectoriesAreWatched) {
    auto nested = tests::write_file(dir / "mods" / "sub" / "n.wasm",
                                    "stub-module\nexport answer i32 7\n");
    ASSERT_TRUE(cache->getOrLoad(nested));
    HotReloadWatcher watcher(*cache, options());
    auto handle = watcher.start();
    ASSERT_TRUE(handle);

    tests::touch_with(nested, "stub-module\nexport answer i32 8\n");
    ASSERT_TRUE(tests::wait_for([&] { return watcher.stats().reloads >= 1; }));
    EXPECT_EQ(engine->compiles(), 2);
}

TEST_F(HotReloadWatcherTest, StopEndsTheLoop) {
    HotReloadWatcher watcher(*cache, options());
    auto handle = watcher.start();
    ASSERT_TRUE(handle);
    EXPECT_TRUE(handle.value()->running());
    handle.value()->stop();
    handle.value()->join();
    EXPECT_FALSE(handle.value()->running());
}
