#include "test_preamble.h"

#include "worker_jsonstore.h"
#include "shared_test_helpers.h"

namespace worker
{
namespace jsonstore
{

// Writes a key unique to this worker, then bumps the shared "counter" key
// `increments` times. Every write is a locked read-modify-write.
int write_id(const std::string &store_path_str, const std::string &id, int increments)
{
    return run_gtest_worker(
        [&]() {
            JsonStore store(store_path_str, {{"foo", "bar"}}, 20s);

            std::error_code ec;
            ASSERT_TRUE(store.set(id, lockstore::platform::get_pid(), &ec)) << ec.message();

            for (int i = 0; i < increments; ++i)
            {
                ASSERT_TRUE(store.with_json_write(
                    [](nlohmann::json &j) { j["counter"] = j.value("counter", 0) + 1; }, &ec))
                    << ec.message();
            }
            ASSERT_TRUE(store.contains(id));
        },
        "jsonstore::write_id");
}

} // namespace jsonstore
} // namespace worker
