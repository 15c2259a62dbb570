#include "SensorStore.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <chrono>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::vector<std::regex> make_filters(std::initializer_list<const char*> patterns) {
    std::vector<std::regex> filters;
    for (const char* p : patterns) filters.emplace_back(p);
    return filters;
}

class SensorFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::path(::testing::TempDir()) /
              ("sensors_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override { fs::remove_all(dir); }

    std::string write(const std::string& name, const std::string& content) {
        fs::path p = dir / name;
        std::ofstream(p) << content;
        return p.string();
    }

    fs::path dir;
};

}  // namespace

TEST(IsFiltered, NoFiltersKeepsEverything) {
    EXPECT_FALSE(is_filtered("foobar", {}));
}

TEST(IsFiltered, UnitKeysCanBeFiltered) {
    EXPECT_TRUE(is_filtered("temperature_cpu#unit", make_filters({"^temperature_.*#unit"})));
}

TEST(IsFiltered, NoMatch) {
    EXPECT_FALSE(is_filtered("foobar", make_filters({"^foo$"})));
    EXPECT_FALSE(is_filtered("foobar", make_filters({"^bar"})));
    EXPECT_FALSE(is_filtered("foobar", make_filters({"123", "bla", "other"})));
}

TEST(IsFiltered, AnyMatch) {
    EXPECT_TRUE(is_filtered("foobar", make_filters({"foo"})));
    EXPECT_TRUE(is_filtered("foobar", make_filters({"bar"})));
    EXPECT_TRUE(is_filtered("foobar", make_filters({"^.+bar"})));
    EXPECT_TRUE(is_filtered("foobar", make_filters({"123", "foo", "other"})));
}

TEST(SensorStore, UpdateMergesValues) {
    SensorStore store;
    store.Update({{"a", "1"}, {"b", "2"}});
    store.Update({{"b", "3"}, {"c", "4"}});
    store.Set("d", "5");
    EXPECT_EQ(4u, store.Size());

    SensorStore::Snapshot snapshot = store.Read();
    ASSERT_NE(nullptr, snapshot.find("a"));
    EXPECT_EQ("1", *snapshot.find("a"));
    EXPECT_EQ("3", *snapshot.find("b"));
    EXPECT_EQ("5", snapshot.values().at("d"));
    EXPECT_EQ(nullptr, snapshot.find("missing"));
}

TEST_F(SensorFilesTest, ReadsKeyValueLines) {
    std::string file = write("values.txt",
                             "# comment\n"
                             "\n"
                             "cpu_temp: 47.8\n"
                             "  cpu_temp#unit :°C  \n"
                             "url: http://host:8080\n"
                             "garbage line\n");
    SensorValues values;
    ASSERT_TRUE(read_key_value_file(file, values, {}));
    EXPECT_EQ(3u, values.size());
    EXPECT_EQ("47.8", values["cpu_temp"]);
    EXPECT_EQ("°C", values["cpu_temp#unit"]);
    EXPECT_EQ("http://host:8080", values["url"]);
}

TEST_F(SensorFilesTest, FiltersKeys) {
    std::string file = write("values.txt", "temperature_cpu: 40\ntemperature_cpu#unit: C\n");
    SensorValues values;
    ASSERT_TRUE(read_key_value_file(file, values, make_filters({"#unit$"})));
    EXPECT_EQ(1u, values.size());
    EXPECT_EQ(1u, values.count("temperature_cpu"));
}

TEST_F(SensorFilesTest, MissingFile) {
    SensorValues values;
    EXPECT_FALSE(read_key_value_file((dir / "nope.txt").string(), values, {}));
}

TEST_F(SensorFilesTest, FilterFileSkipsInvalidExpressions) {
    std::string file = write("filters", "# filters\n^net_\n[unclosed\n\nunit$\n");
    auto filters = read_filter_file(file);
    ASSERT_EQ(2u, filters.size());
    EXPECT_TRUE(is_filtered("net_rx", filters));
    EXPECT_TRUE(is_filtered("cpu#unit", filters));
    EXPECT_FALSE(is_filtered("cpu", filters));
}

TEST_F(SensorFilesTest, WatcherReadsAllTextFiles) {
    write("cpu.txt", "cpu: 10\n");
    write("mem.txt", "mem: 20\nskip_me: 1\n");
    write("notes.md", "other: 30\n");

    SensorStore store;
    SensorFileWatcher watcher(dir.string(), store, make_filters({"^skip"}));
    ASSERT_TRUE(watcher.ReadAll());

    SensorStore::Snapshot snapshot = store.Read();
    EXPECT_EQ(2u, snapshot.values().size());
    EXPECT_EQ("10", *snapshot.find("cpu"));
    EXPECT_EQ("20", *snapshot.find("mem"));
    EXPECT_EQ(nullptr, snapshot.find("other"));
}

TEST_F(SensorFilesTest, WatcherReadsSingleFile) {
    std::string file = write("single.txt", "a: 1\n");
    SensorStore store;
    SensorFileWatcher watcher(file, store);
    ASSERT_TRUE(watcher.ReadAll());
    EXPECT_EQ(1u, store.Size());
}

TEST_F(SensorFilesTest, WatcherMissingPath) {
    SensorStore store;
    SensorFileWatcher watcher((dir / "absent").string(), store);
    EXPECT_FALSE(watcher.ReadAll());
    EXPECT_EQ(0u, store.Size());
}

TEST_F(SensorFilesTest, WatcherWithoutWatchableDirectoryShutsDownCleanly) {
    SensorStore store;
    {
        SensorFileWatcher watcher((dir / "absent" / "values.txt").string(), store);
        watcher.Start();
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        EXPECT_FALSE(watcher.Watching());
        // a second start after the worker gave up must not replace a joinable thread
        watcher.Start();
    }
    SensorFileWatcher watcher((dir / "absent").string(), store);
    watcher.Start();
    watcher.Stop();
    watcher.Stop();
    EXPECT_FALSE(watcher.Watching());
}

TEST_F(SensorFilesTest, WatcherPicksUpModifiedFiles) {
    write("cpu.txt", "cpu: 10\n");
    SensorStore store;
    SensorFileWatcher watcher(dir.string(), store);
    ASSERT_TRUE(watcher.ReadAll());
    watcher.Start();
    for (int i = 0; i < 50 && !watcher.Watching(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_TRUE(watcher.Watching());

    write("cpu.txt", "cpu: 20\n");
    std::string value;
    for (int i = 0; i < 100 && value != "20"; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        SensorStore::Snapshot snapshot = store.Read();
        if (const std::string* v = snapshot.find("cpu")) value = *v;
    }
    EXPECT_EQ("20", value);
    watcher.Stop();
}
