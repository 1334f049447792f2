#include "test_preamble.h"

#include "worker_filelock.h"
#include "shared_test_helpers.h"

namespace worker
{
namespace filelock
{

// Takes the lock and dies without running any exit handler, leaving the
// marker behind with this PID.
int hold_and_crash(const std::string &resource_path_str)
{
    FileLock lock(resource_path_str, 1000ms);
    if (!lock.acquire(false))
        return 1;
    std::fflush(stderr);
    std::_Exit(0);
}

// Takes the lock and exits normally without releasing it. The exit hook must
// remove the marker.
int exit_while_holding(const std::string &resource_path_str)
{
    return run_gtest_worker(
        [&]() {
            // Deliberately leaked: only the exit hook may release it.
            auto *lock = new FileLock(resource_path_str, 1000ms);
            ASSERT_TRUE(lock->acquire(false));
            ASSERT_EQ(FileLock::read_owner(resource_path_str), lockstore::platform::get_pid());
        },
        "filelock::exit_while_holding");
}

int nonblocking_expect_fail(const std::string &resource_path_str)
{
    return run_gtest_worker(
        [&]() {
            FileLock lock(resource_path_str, 100ms);
            std::error_code ec;
            ASSERT_FALSE(lock.acquire(false, &ec));
            ASSERT_EQ(ec, std::errc::resource_unavailable_try_again);
            ASSERT_FALSE(lock.locked());

            // A bounded blocking attempt must time out, not succeed.
            ASSERT_FALSE(lock.acquire(true, &ec));
            ASSERT_EQ(ec, std::errc::timed_out);
        },
        "filelock::nonblocking_expect_fail");
}

int blocking_acquire(const std::string &resource_path_str)
{
    return run_gtest_worker(
        [&]() {
            FileLock lock(resource_path_str, 10s, 20ms);
            std::error_code ec;
            ASSERT_TRUE(lock.acquire(true, &ec)) << ec.message();
            ASSERT_EQ(FileLock::read_owner(resource_path_str), lockstore::platform::get_pid());
            ASSERT_TRUE(lock.release(&ec));
        },
        "filelock::blocking_acquire");
}

// Appends `num_lines` lines of `letter` to the log, one character at a time,
// each line under the lock. Interleaving would show up as mixed lines.
int append_lines(const std::string &resource_path_str, const std::string &log_path_str,
                 const std::string &letter, int num_lines)
{
    return run_gtest_worker(
        [&]() {
            FileLock lock(resource_path_str, 20s, 5ms);
            for (int i = 0; i < num_lines; ++i)
            {
                ScopedFileLock guard(lock);
                ASSERT_TRUE(guard.valid()) << guard.error_code().message();

                std::ofstream out(log_path_str, std::ios::app);
                ASSERT_TRUE(out.is_open());
                for (int c = 0; c < 20; ++c)
                {
                    out << letter << std::flush;
                    std::this_thread::sleep_for(std::chrono::microseconds(100));
                }
                out << '\n' << std::flush;
            }
        },
        "filelock::append_lines");
}

} // namespace filelock
} // namespace worker
