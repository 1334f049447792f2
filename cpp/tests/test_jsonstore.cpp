// tests/test_jsonstore.cpp
//
// Unit and multi-process tests for lockstore::utils::JsonStore.

#include "test_preamble.h"

#include "helpers/shared_test_helpers.h"
#include "helpers/test_entrypoint.h"
#include "helpers/test_process_utils.h"
using namespace test_utils;
using json = nlohmann::json;

class JsonStoreTest : public ::testing::Test {
protected:
    static fs::path g_temp_dir_;

    static void SetUpTestSuite()
    {
        g_temp_dir_ = fs::temp_directory_path() /
                      fmt::format("lockstore_jsonstore_tests_{}", lockstore::platform::get_pid());
        fs::create_directories(g_temp_dir_);
    }

    static void TearDownTestSuite()
    {
        std::error_code ec;
        fs::remove_all(g_temp_dir_, ec);
    }

    fs::path fresh_path(const std::string &name) const
    {
        auto p = g_temp_dir_ / name;
        std::error_code ec;
        fs::remove(p, ec);
        fs::remove(FileLock::get_expected_lock_fullname_for(p), ec);
        return p;
    }

    static json read_disk(const fs::path &p)
    {
        std::string text;
        if (!read_file_contents(p, text))
            return json();
        return json::parse(text);
    }
};

fs::path JsonStoreTest::g_temp_dir_;

TEST_F(JsonStoreTest, DefaultsWrittenWhenFileMissing)
{
    auto p = fresh_path("defaults.json");
    std::error_code ec;
    JsonStore store(p, {{"foo", "bar"}, {"n", 1}}, JsonStore::DEFAULT_LOCK_TIMEOUT, &ec);
    ASSERT_FALSE(ec) << ec.message();

    ASSERT_TRUE(fs::exists(p));
    EXPECT_EQ(read_disk(p), (json{{"foo", "bar"}, {"n", 1}}));
    EXPECT_EQ(store.get("foo"), json("bar"));
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.path(), p);
    EXPECT_EQ(store.lock_timeout(), JsonStore::DEFAULT_LOCK_TIMEOUT);

    // The lock used for the write is gone.
    EXPECT_FALSE(fs::exists(FileLock::get_expected_lock_fullname_for(p)));
}

TEST_F(JsonStoreTest, EmptyDefaultsDoNotCreateFile)
{
    auto p = fresh_path("no_defaults.json");
    JsonStore store(p);
    EXPECT_FALSE(fs::exists(p));
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.get("missing"), std::nullopt);
    EXPECT_EQ(store.get("missing", 7), json(7));
}

TEST_F(JsonStoreTest, DocumentIsPrettyPrinted)
{
    auto p = fresh_path("pretty.json");
    JsonStore store(p);
    ASSERT_TRUE(store.set("b", 2));
    ASSERT_TRUE(store.set("a", 1));

    std::string text;
    ASSERT_TRUE(read_file_contents(p, text));
    EXPECT_EQ(text, "{\n  \"a\": 1,\n  \"b\": 2\n}");
}

TEST_F(JsonStoreTest, SetPersistsAcrossInstances)
{
    auto p = fresh_path("roundtrip.json");
    {
        JsonStore store(p, {{"foo", "bar"}});
        std::error_code ec;
        ASSERT_TRUE(store.set("port", 1234, &ec)) << ec.message();
        ASSERT_TRUE(store.set("nested", {{"x", json::array({1, 2, 3})}}, &ec));
    }
    JsonStore reopened(p);
    EXPECT_EQ(reopened.get_or<int>("port", 0), 1234);
    EXPECT_EQ(reopened.get_or<std::string>("foo", ""), "bar");
    EXPECT_EQ(reopened.get("nested"), (json{{"x", {1, 2, 3}}}));
    EXPECT_EQ(reopened.get_or<int>("foo", -1), -1); // Not convertible.
}

TEST_F(JsonStoreTest, MutationRereadsDiskAndKeepsForeignKeys)
{
    auto p = fresh_path("merge.json");
    JsonStore a(p);
    JsonStore b(p);

    ASSERT_TRUE(a.set("from_a", 1));
    // b's mirror is stale, but its write starts from the disk document.
    ASSERT_TRUE(b.set("from_b", 2));

    EXPECT_EQ(read_disk(p), (json{{"from_a", 1}, {"from_b", 2}}));
    EXPECT_TRUE(b.contains("from_a"));

    // a does not see b's write until it touches the disk.
    EXPECT_FALSE(a.contains("from_b"));
    auto loaded = a.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(a.contains("from_b"));
    EXPECT_EQ(*loaded, a.data());
}

TEST_F(JsonStoreTest, DefaultsFillAbsentKeysOfExistingDocument)
{
    auto p = fresh_path("default_fill.json");
    write_raw_file(p, R"({"theme": "light"})");

    JsonStore store(p, {{"theme", "dark"}, {"lang", "en"}});
    // Disk wins; missing default keys are added and persisted at construction.
    EXPECT_EQ(store.get("theme"), json("light"));
    EXPECT_EQ(store.get("lang"), json("en"));
    EXPECT_EQ(read_disk(p), (json{{"theme", "light"}, {"lang", "en"}}));

    ASSERT_TRUE(store.set("size", 3));
    EXPECT_EQ(read_disk(p), (json{{"theme", "light"}, {"lang", "en"}, {"size", 3}}));
}

TEST_F(JsonStoreTest, RemovedDefaultKeyStaysRemoved)
{
    auto p = fresh_path("removed_default.json");
    JsonStore store(p, {{"foo", "bar"}});

    ASSERT_TRUE(store.remove("foo"));
    EXPECT_FALSE(store.contains("foo"));

    // Later mutations and reloads of the same instance must not bring it back.
    ASSERT_TRUE(store.set("x", 1));
    EXPECT_FALSE(store.contains("foo"));
    ASSERT_TRUE(store.update({{"y", 2}}));
    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->contains("foo"));
    EXPECT_EQ(read_disk(p), (json{{"x", 1}, {"y", 2}}));

    JsonStore fresh(p);
    EXPECT_FALSE(fresh.contains("foo"));
    EXPECT_EQ(fresh.get("x"), json(1));
}

TEST_F(JsonStoreTest, RemoveAndMissingKey)
{
    auto p = fresh_path("remove.json");
    JsonStore store(p, {{"keep", 1}, {"drop", 2}});

    std::error_code ec;
    ASSERT_TRUE(store.remove("drop", &ec));
    EXPECT_FALSE(store.contains("drop"));
    EXPECT_EQ(read_disk(p), (json{{"keep", 1}}));

    auto before = fs::last_write_time(p);
    EXPECT_FALSE(store.remove("drop", &ec));
    EXPECT_EQ(ec, LockStoreErrc::key_not_found);
    EXPECT_EQ(fs::last_write_time(p), before);
    EXPECT_EQ(read_disk(p), (json{{"keep", 1}}));
}

TEST_F(JsonStoreTest, UpdateMergesTopLevelKeys)
{
    auto p = fresh_path("update.json");
    JsonStore store(p, {{"a", 1}, {"b", {{"inner", true}}}});

    ASSERT_TRUE(store.update({{"b", 2}, {"c", 3}}));
    EXPECT_EQ(read_disk(p), (json{{"a", 1}, {"b", 2}, {"c", 3}}));

    std::error_code ec;
    EXPECT_FALSE(store.update(json::array({1, 2}), &ec));
    EXPECT_EQ(ec, std::errc::invalid_argument);
    EXPECT_EQ(read_disk(p), (json{{"a", 1}, {"b", 2}, {"c", 3}}));
}

TEST_F(JsonStoreTest, SetdefaultOnlyInsertsWhenAbsent)
{
    auto p = fresh_path("setdefault.json");
    JsonStore store(p, {{"present", "old"}});

    EXPECT_EQ(store.setdefault("present", "new"), json("old"));
    EXPECT_EQ(store.setdefault("absent", 42), json(42));
    EXPECT_EQ(read_disk(p), (json{{"present", "old"}, {"absent", 42}}));
}

TEST_F(JsonStoreTest, WithJsonWriteAndRead)
{
    auto p = fresh_path("callbacks.json");
    JsonStore store(p);

    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(store.with_json_write([](json &j) { j["hits"] = j.value("hits", 0) + 1; }));
    EXPECT_EQ(read_disk(p)["hits"], 3);

    int seen = 0;
    ASSERT_TRUE(store.with_json_read([&seen](const json &j) { seen = j.at("hits").get<int>(); }));
    EXPECT_EQ(seen, 3);
}

TEST_F(JsonStoreTest, ThrowingCallbackWritesNothing)
{
    auto p = fresh_path("throwing.json");
    JsonStore store(p, {{"v", 1}});

    std::error_code ec;
    EXPECT_FALSE(store.with_json_write(
        [](json &j)
        {
            j["v"] = 2;
            throw std::runtime_error("abort");
        },
        &ec));
    EXPECT_EQ(ec, std::errc::operation_canceled);
    EXPECT_EQ(store.get("v"), json(1));
    EXPECT_EQ(read_disk(p), (json{{"v", 1}}));

    // Replacing the document with a non-object is refused too.
    EXPECT_FALSE(store.with_json_write([](json &j) { j = 5; }, &ec));
    EXPECT_EQ(ec, LockStoreErrc::document_not_object);
    EXPECT_EQ(read_disk(p), (json{{"v", 1}}));
}

TEST_F(JsonStoreTest, ReentrantCallsAreRefused)
{
    auto p = fresh_path("reentrant.json");
    JsonStore store(p);

    std::error_code inner_set, inner_load, inner_remove;
    bool set_ok = true;
    ASSERT_TRUE(store.with_json_write(
        [&](json &j)
        {
            j["outer"] = true;
            set_ok = store.set("inner", 1, &inner_set);
            store.load(&inner_load);
            store.remove("outer", &inner_remove);
        }));

    EXPECT_FALSE(set_ok);
    EXPECT_EQ(inner_set, LockStoreErrc::reentrant_access);
    EXPECT_EQ(inner_set, std::errc::resource_deadlock_would_occur);
    EXPECT_EQ(inner_load, LockStoreErrc::reentrant_access);
    EXPECT_EQ(inner_remove, LockStoreErrc::reentrant_access);
    EXPECT_EQ(read_disk(p), (json{{"outer", true}}));

    // The guard is gone once the callback returns.
    EXPECT_TRUE(store.set("after", 1));
}

TEST_F(JsonStoreTest, CorruptDocumentIsLeftUntouched)
{
    auto p = fresh_path("corrupt.json");
    const std::string garbage = "{ this is not json";
    write_raw_file(p, garbage);

    std::error_code ec;
    JsonStore store(p, {{"d", 1}}, JsonStore::DEFAULT_LOCK_TIMEOUT, &ec);
    EXPECT_EQ(ec, LockStoreErrc::document_parse_error);
    EXPECT_EQ(store.get("d"), json(1)); // Mirror falls back to the defaults.

    EXPECT_FALSE(store.set("x", 1, &ec));
    EXPECT_EQ(ec, LockStoreErrc::document_parse_error);
    EXPECT_EQ(store.load(&ec), std::nullopt);
    EXPECT_EQ(ec, LockStoreErrc::document_parse_error);

    std::string text;
    ASSERT_TRUE(read_file_contents(p, text));
    EXPECT_EQ(text, garbage);
}

TEST_F(JsonStoreTest, NonObjectDocumentIsRejected)
{
    auto p = fresh_path("array.json");
    write_raw_file(p, "[1, 2, 3]");

    std::error_code ec;
    JsonStore store(p, json::object(), JsonStore::DEFAULT_LOCK_TIMEOUT, &ec);
    EXPECT_EQ(ec, LockStoreErrc::document_not_object);
    EXPECT_FALSE(store.set("x", 1, &ec));
    EXPECT_EQ(ec, LockStoreErrc::document_not_object);
    EXPECT_EQ(read_disk(p), json::array({1, 2, 3}));
}

TEST_F(JsonStoreTest, BlankFileCountsAsEmptyDocument)
{
    auto p = fresh_path("blank.json");
    write_raw_file(p, "  \n");

    std::error_code ec;
    JsonStore store(p, {{"d", 1}}, JsonStore::DEFAULT_LOCK_TIMEOUT, &ec);
    EXPECT_FALSE(ec) << ec.message();
    ASSERT_TRUE(store.set("x", 2));
    EXPECT_EQ(read_disk(p), (json{{"d", 1}, {"x", 2}}));
}

TEST_F(JsonStoreTest, LockTimeoutLeavesStateUnchanged)
{
    auto p = fresh_path("timeout.json");
    JsonStore store(p, {{"v", 1}}, 100ms);

    FileLock blocker(p, 100ms);
    ASSERT_TRUE(blocker.acquire());

    std::error_code ec;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(store.set("v", 2, &ec));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(ec, std::errc::timed_out);
    EXPECT_EQ(store.get("v"), json(1));

    EXPECT_FALSE(store.save(&ec));
    EXPECT_EQ(ec, std::errc::timed_out);

    blocker.release();
    EXPECT_EQ(read_disk(p), (json{{"v", 1}}));
    EXPECT_TRUE(store.set("v", 2, &ec)) << ec.message();
}

TEST_F(JsonStoreTest, SaveOverwritesWithMirror)
{
    auto p = fresh_path("save.json");
    JsonStore a(p);
    JsonStore b(p);
    ASSERT_TRUE(a.set("x", 1));

    // b never loaded x; save replaces the whole document with b's mirror.
    ASSERT_TRUE(b.save());
    EXPECT_EQ(read_disk(p), json::object());
}

#if !defined(PLATFORM_WIN64)
TEST_F(JsonStoreTest, SymlinkTargetIsRefused)
{
    auto real = fresh_path("real.json");
    auto link = fresh_path("link.json");
    write_raw_file(real, R"({"a": 1})");
    fs::create_symlink(real, link);

    JsonStore store(link);
    EXPECT_EQ(store.get("a"), json(1));

    std::error_code ec;
    EXPECT_FALSE(store.set("b", 2, &ec));
    EXPECT_EQ(ec, std::errc::operation_not_permitted);
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(link)));
    EXPECT_EQ(read_disk(real), (json{{"a", 1}}));
    EXPECT_FALSE(store.contains("b"));
}
#endif

TEST_F(JsonStoreTest, ConcurrentThreadsLoseNoUpdates)
{
    auto p = fresh_path("threads.json");
    const int THREADS = 4;
    const int ITERS = scaled_value(25, 5);

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t)
    {
        threads.emplace_back(
            [&, t]()
            {
                // One store per thread, as separate processes would have.
                JsonStore store(p, json::object(), 20s);
                for (int i = 0; i < ITERS; ++i)
                {
                    store.with_json_write([](json &j) { j["n"] = j.value("n", 0) + 1; });
                }
                store.set(fmt::format("thread_{}", t), true);
            });
    }
    for (auto &th : threads)
        th.join();

    auto doc = read_disk(p);
    EXPECT_EQ(doc["n"], THREADS * ITERS);
    for (int t = 0; t < THREADS; ++t)
        EXPECT_TRUE(doc.contains(fmt::format("thread_{}", t)));
}

TEST_F(JsonStoreTest, MultiProcessWritersKeepEveryKey)
{
    auto p = fresh_path("mp_store.json");
    const int PROCS = 5;
    const int INCREMENTS = scaled_value(10, 3);

    std::vector<ProcessHandle> procs;
    for (int i = 0; i < PROCS; ++i)
    {
        ProcessHandle h =
            spawn_worker_process(g_self_exe_path, "jsonstore.write_id",
                                 {p.string(), fmt::format("worker_{}", i), std::to_string(INCREMENTS)});
        ASSERT_NE(h, NULL_PROC_HANDLE);
        procs.push_back(h);
    }
    for (auto h : procs)
        ASSERT_EQ(wait_for_worker_and_get_exit_code(h), 0);

    JsonStore store(p);
    EXPECT_EQ(store.get("foo"), json("bar"));
    EXPECT_EQ(store.get_or<int>("counter", 0), PROCS * INCREMENTS);
    for (int i = 0; i < PROCS; ++i)
        EXPECT_TRUE(store.contains(fmt::format("worker_{}", i))) << "worker_" << i;
    EXPECT_FALSE(fs::exists(FileLock::get_expected_lock_fullname_for(p)));
}
