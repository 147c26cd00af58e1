#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "../../common/stub_engine.h"
#include "../../common/test_helpers.h"
#include <dlinkwm/runtime/host_method_registry.h>
#include <dlinkwm/runtime/module_cache.h>

using namespace dlinkwm;
using namespace dlinkwm::runtime;

namespace {

const char* kHelloV1 = "stub-module\n"
                       "data 256 hello wasm!\n"
                       "export hello i32 256\n"
                       "export answer i32 42\n";

const char* kHelloV2 = "stub-module\n"
                       "data 256 hello again!\n"
                       "export hello i32 256\n"
                       "export answer i32 43\n";

class ModuleCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<tests::StubEngine>();
        cache = std::make_unique<ModuleCache>(engine, registry);
        modulePath = tests::write_file(dir / "mod.wasm", kHelloV1);
    }

    int32_t callAnswer(const InstanceHandle& handle) {
        return handle->withExclusive([](IGuestInstance& inst) {
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

TEST_F(ModuleCacheTest, RepeatedLoadReusesCompiledModuleAndInstance) {
    auto first = cache->getOrLoad(modulePath);
    ASSERT_TRUE(first) << first.error().message;
    auto second = cache->getOrLoad(modulePath);
    ASSERT_TRUE(second);

    EXPECT_EQ(engine->compiles(), 1);
    EXPECT_EQ(engine->instantiations(), 1);
    EXPECT_EQ(first.value().get(), second.value().get());

    auto stats = cache->stats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.compiles, 1u);
}

TEST_F(ModuleCacheTest, EquivalentPathSpellingsShareOneEntry) {
    ASSERT_TRUE(cache->getOrLoad(modulePath));
    auto alt = modulePath.parent_path() / "." / "mod.wasm";
    ASSERT_TRUE(cache->getOrLoad(alt));
    EXPECT_EQ(engine->compiles(), 1);
}

TEST_F(ModuleCacheTest, HotReloadYieldsDistinctHandleAndObservesNewBody) {
    auto before = cache->getOrLoad(modulePath);
    ASSERT_TRUE(before);
    EXPECT_EQ(callAnswer(before.value()), 42);

    tests::write_file(modulePath, kHelloV2);
    auto reloaded = cache->hotReload(modulePath);
    ASSERT_TRUE(reloaded) << reloaded.error().message;
    auto after = cache->getOrLoad(modulePath);
    ASSERT_TRUE(after);

    EXPECT_NE(before.value().get(), after.value().get());
    EXPECT_EQ(reloaded.value().get(), after.value().get());
    EXPECT_GT(after.value()->generation(), before.value()->generation());
    EXPECT_EQ(callAnswer(after.value()), 43);
    EXPECT_EQ(engine->compiles(), 2);

    // The old holder can still finish its work
    EXPECT_EQ(callAnswer(before.value()), 42);
}

TEST_F(ModuleCacheTest, HotReloadRecompilesEvenWhenBytesUnchanged) {
    ASSERT_TRUE(cache->getOrLoad(modulePath));
    ASSERT_TRUE(cache->hotReload(modulePath));
    EXPECT_EQ(engine->compiles(), 2);
    EXPECT_EQ(cache->stats().reloads, 1u);
}

TEST_F(ModuleCacheTest, InvalidateIsIdempotent) {
    ASSERT_TRUE(cache->getOrLoad(modulePath));
    EXPECT_TRUE(cache->containsModule(modulePath));
    EXPECT_TRUE(cache->containsInstance(modulePath));

    EXPECT_TRUE(cache->invalidate(modulePath));
    EXPECT_FALSE(cache->invalidate(modulePath));
    EXPECT_FALSE(cache->containsModule(modulePath));
    EXPECT_FALSE(cache->containsInstance(modulePath));
    EXPECT_FALSE(cache->invalidate(dir / "never-loaded.wasm"));
}

TEST_F(ModuleCacheTest, ResetInstanceReusesCompiledModuleWhenBytesUnchanged) {
    auto first = cache->getOrLoad(modulePath);
    ASSERT_TRUE(first);
    auto record = cache->findModule(modulePath);
    ASSERT_TRUE(record);

    EXPECT_TRUE(cache->resetInstance(modulePath));
    EXPECT_TRUE(cache->containsModule(modulePath));
    auto second = cache->getOrLoad(modulePath);
    ASSERT_TRUE(second);

    EXPECT_NE(first.value().get(), second.value().get());
    EXPECT_EQ(second.value()->module().get(), record.get());
    EXPECT_EQ(engine->compiles(), 1);
    EXPECT_EQ(engine->instantiations(), 2);
    EXPECT_EQ(cache->stats().moduleReuses, 1u);
}

TEST_F(ModuleCacheTest, ResetInstanceRecompilesChangedBytes) {
    ASSERT_TRUE(cache->getOrLoad(modulePath));
    tests::write_file(modulePath, kHelloV2);
    cache->resetInstance(modulePath);
    auto loaded = cache->getOrLoad(modulePath);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(engine->compiles(), 2);
    EXPECT_EQ(callAnswer(loaded.value()), 43);
}

TEST_F(ModuleCacheTest, MissingFileIsIoError) {
    auto res = cache->getOrLoad(dir / "missing.wasm");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::IoError);
    EXPECT_NE(res.error().message.find("missing.wasm"), std::string::npos);
}

TEST_F(ModuleCacheTest, InvalidBytesAreCompileError) {
    auto bad = tests::write_file(dir / "bad.wasm", "not a module");
    auto res = cache->getOrLoad(bad);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::CompileError);
    EXPECT_FALSE(cache->containsModule(bad));
}

TEST_F(ModuleCacheTest, UnresolvedImportIsInstantiationError) {
    auto p = tests::write_file(dir / "imports.wasm", "stub-module\nimport env missing_fn\n");
    auto res = cache->getOrLoad(p);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InstantiationError);
    EXPECT_FALSE(cache->containsInstance(p));
}

TEST_F(ModuleCacheTest, HostImportsResolveAndHeapOptionsArePassed) {
    ModuleCache::Options options;
    options.heap.base = 0x20000;
    options.heap.size = 4096;
    ModuleCache custom(engine, registry, options);

    auto p = tests::write_file(dir / "host.wasm", "stub-module\n"
                                                  "import dlinkwm_host universal_invoke\n"
                                                  "import dlinkwm_host host_malloc\n"
                                                  "import dlinkwm_host host_free\n");
    ASSERT_TRUE(custom.getOrLoad(p));
    ASSERT_TRUE(engine->lastHeap().base.has_value());
    EXPECT_EQ(*engine->lastHeap().base, 0x20000u);
    EXPECT_EQ(engine->lastHeap().size, 4096u);
}

TEST_F(ModuleCacheTest, DefaultHeapOptionsLeaveBaseToInstantiation) {
    ASSERT_TRUE(cache->getOrLoad(modulePath));
    EXPECT_FALSE(engine->lastHeap().base.has_value());
    EXPECT_EQ(engine->lastHeap().size, 1024u * 1024u);
}

TEST_F(ModuleCacheTest, LoadLocksArePrunedAfterInvalidateAndFailedLoads) {
    ASSERT_TRUE(cache->getOrLoad(modulePath));
    EXPECT_EQ(cache->stats().loadLocks, 1u);
    EXPECT_TRUE(cache->invalidate(modulePath));
    EXPECT_EQ(cache->stats().loadLocks, 0u);

    for (int i = 0; i < 50; ++i) {
        auto missing = dir / ("missing-" + std::to_string(i) + ".wasm");
        ASSERT_FALSE(cache->getOrLoad(missing));
        EXPECT_FALSE(cache->invalidate(missing));
    }
    EXPECT_EQ(cache->stats().loadLocks, 0u);

    // Still usable after pruning
    auto reloaded = cache->getOrLoad(modulePath);
    ASSERT_TRUE(reloaded);
    EXPECT_EQ(callAnswer(reloaded.value()), 42);
}

TEST_F(ModuleCacheTest, ConcurrentFirstLoadCompilesOnce) {
    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::vector<InstanceRecord*> seen(kThreads, nullptr);
    std::atomic<bool> go{false};
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto res = cache->getOrLoad(modulePath);
            if (res)
                seen[i] = res.value().get();
        });
    }
    go.store(true);
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(engine->compiles(), 1);
    EXPECT_EQ(engine->instantiations(), 1);
    for (auto* p : seen) {
        EXPECT_EQ(p, seen.front());
    }
}

TEST_F(ModuleCacheTest, NormalizeKeyIsAbsoluteAndLexicallyNormal) {
    auto key = ModuleCache::normalizeKey("a/./b/../mod.wasm");
    std::filesystem::path p(key);
    EXPECT_TRUE(p.is_absolute());
    EXPECT_EQ(p.filename().string(), "mod.wasm");
    EXPECT_EQ(p.parent_path().filename().string(), "a");
}
