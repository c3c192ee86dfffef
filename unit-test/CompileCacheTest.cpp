#include <chrono>
#include <thread>
#include "gtest/gtest.h"
#include "starjudge/common/io_utils.hpp"
#include "starjudge/compile_cache.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace starjudge;
namespace fs = std::filesystem;

class CompileCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test::make_temp_directory("cache");
        artifact = dir / "artifact";
        write_file_content(artifact, "compiled");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    fs::path dir;
    fs::path artifact;
};

TEST_F(CompileCacheTest, HashKeyTest) {
    // 缓存键同时取决于语言和代码
    string key = compile_cache::hash_key(language::CPP, "int main() {}");
    EXPECT_EQ(key.size(), 32u);
    EXPECT_EQ(key.find_first_not_of("0123456789abcdef"), string::npos);
    EXPECT_EQ(key, compile_cache::hash_key(language::CPP, "int main() {}"));
    EXPECT_NE(key, compile_cache::hash_key(language::JAVA, "int main() {}"));
    EXPECT_NE(key, compile_cache::hash_key(language::CPP, "int main() { }"));
}

TEST_F(CompileCacheTest, KnownDigestTest) {
    // echo -n "Python:" | md5sum
    EXPECT_EQ(compile_cache::hash_key(language::PYTHON, ""), "913ffb6e71174bb165d75e7127aff4c1");
    EXPECT_EQ(compile_cache::hash_key(language::JAVA, ""), "53ea65b3564b4fea12024097fcabae0e");
    // printf 'C++:int main() { return 0; }\n' | md5sum
    EXPECT_EQ(compile_cache::hash_key(language::CPP, "int main() { return 0; }\n"), "b242bbb490b5c04e2376f2e500bf177b");
}

TEST_F(CompileCacheTest, PutAndGetTest) {
    compile_cache cache(dir / "cache");
    string key = compile_cache::hash_key(language::CPP, "code");
    EXPECT_FALSE(cache.get(key).has_value());

    ASSERT_TRUE(cache.put(key, artifact, "exe"));
    auto cached = cache.get(key);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, dir / "cache" / (key + ".exe"));
    EXPECT_EQ(read_file_content(*cached), "compiled");
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST_F(CompileCacheTest, StaleEntryTest) {
    compile_cache cache(dir / "cache");
    string key = compile_cache::hash_key(language::CPP, "code");
    ASSERT_TRUE(cache.put(key, artifact, "exe"));
    fs::remove(*cache.get(key));

    EXPECT_FALSE(cache.get(key).has_value());
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST_F(CompileCacheTest, PutFailureTest) {
    compile_cache cache(dir / "cache");
    string key = compile_cache::hash_key(language::CPP, "code");
    EXPECT_FALSE(cache.put(key, dir / "missing", "exe"));
    EXPECT_FALSE(cache.get(key).has_value());

    // 不留下临时文件
    EXPECT_TRUE(fs::is_empty(dir / "cache"));
}

TEST_F(CompileCacheTest, LastWriterWinsTest) {
    compile_cache cache(dir / "cache");
    string key = compile_cache::hash_key(language::CPP, "code");
    ASSERT_TRUE(cache.put(key, artifact, "exe"));
    write_file_content(artifact, "recompiled");
    ASSERT_TRUE(cache.put(key, artifact, "exe"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(read_file_content(*cache.get(key)), "recompiled");
}

TEST_F(CompileCacheTest, ReindexTest) {
    string key = compile_cache::hash_key(language::JAVA, "class Main {}");
    {
        compile_cache cache(dir / "cache");
        ASSERT_TRUE(cache.put(key, artifact, "class"));
    }
    write_file_content(dir / "cache" / "unrelated.txt", "");
    write_file_content(dir / "cache" / ("." + key + ".leftover.tmp"), "");

    compile_cache cache(dir / "cache");
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.get(key).has_value());
    EXPECT_FALSE(fs::exists(dir / "cache" / ("." + key + ".leftover.tmp")));
    EXPECT_TRUE(fs::exists(dir / "cache" / "unrelated.txt"));
}

TEST_F(CompileCacheTest, ReindexKeepsRecentEntriesTest) {
    string keys[] = {compile_cache::hash_key(language::CPP, "old"),
                     compile_cache::hash_key(language::CPP, "newest"),
                     compile_cache::hash_key(language::CPP, "middle")};
    fs::create_directories(dir / "cache");
    auto now = fs::file_time_type::clock::now();
    for (int i = 0; i < 3; ++i) {
        fs::path file = dir / "cache" / (keys[i] + ".exe");
        write_file_content(file, "compiled");
        fs::last_write_time(file, now - chrono::hours(i == 0 ? 2 : i == 1 ? 0 : 1));
    }

    // 重新索引时按修改时间排序，淘汰最早写入的缓存项
    compile_cache cache(dir / "cache", 2);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(fs::exists(dir / "cache" / (keys[0] + ".exe")));
    EXPECT_TRUE(cache.get(keys[1]).has_value());
    EXPECT_TRUE(cache.get(keys[2]).has_value());
}

TEST_F(CompileCacheTest, EvictionTest) {
    compile_cache cache(dir / "cache", 2);
    string a = compile_cache::hash_key(language::CPP, "a");
    string b = compile_cache::hash_key(language::CPP, "b");
    string c = compile_cache::hash_key(language::CPP, "c");
    ASSERT_TRUE(cache.put(a, artifact, "exe"));
    ASSERT_TRUE(cache.put(b, artifact, "exe"));
    EXPECT_TRUE(cache.get(a).has_value());  // a 比 b 更近被使用

    ASSERT_TRUE(cache.put(c, artifact, "exe"));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.get(b).has_value());
    EXPECT_FALSE(fs::exists(dir / "cache" / (b + ".exe")));
    EXPECT_TRUE(cache.get(a).has_value());
    EXPECT_TRUE(cache.get(c).has_value());
}

TEST_F(CompileCacheTest, ConcurrentPutTest) {
    compile_cache cache(dir / "cache");
    string key = compile_cache::hash_key(language::CPP, "code");
    vector<thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] {
            for (int j = 0; j < 20; ++j) {
                cache.put(key, artifact, "exe");
                if (auto cached = cache.get(key)) EXPECT_EQ(read_file_content(*cached), "compiled");
            }
        });
    for (auto &th : threads) th.join();
    EXPECT_EQ(cache.size(), 1u);
}
