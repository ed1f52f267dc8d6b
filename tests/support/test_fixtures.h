/**
 * @file test_fixtures.h
 * @brief Test fixtures shared by unit and integration tests
 */

#ifndef KCENON_UNIFIED_FS_TESTS_SUPPORT_TEST_FIXTURES_H
#define KCENON_UNIFIED_FS_TESTS_SUPPORT_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/unified_fs/unified_fs.h>

#include "memory_sftp.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::unified_fs::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("unified_fs_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto path(const std::string& relative) const -> std::string {
        return (test_dir_ / relative).string();
    }

    auto write_file(const std::string& relative, const std::string& content)
        -> std::filesystem::path {
        auto target = test_dir_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream file(target, std::ios::binary | std::ios::trunc);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return target;
    }

    auto create_test_file(const std::string& relative, std::size_t size)
        -> std::filesystem::path {
        return write_file(relative, random_content(size));
    }

    auto read_file(const std::string& relative) const -> std::string {
        std::ifstream file(test_dir_ / relative, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file),
                           std::istreambuf_iterator<char>());
    }

    auto exists(const std::string& relative) const -> bool {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(test_dir_ / relative, ec));
    }

    /// Entry names below @p relative, sorted
    auto names_in(const std::string& relative) const -> std::vector<std::string> {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir_ / relative)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    static auto random_content(std::size_t size) -> std::string {
        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);
        std::string content(size, '\0');
        for (auto& c : content) {
            c = static_cast<char>(dis(gen));
        }
        return content;
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Thread-safe recorder for event bus deliveries
 */
class event_recorder {
public:
    auto handler() -> event_bus::handler {
        return [this](const event& e) {
            std::shared_ptr<std::function<void(const event&)>> hook;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                events_.push_back(e);
                hook = on_event_;
            }
            // Shared so that state captured by a mutable hook persists
            if (hook && *hook) {
                (*hook)(e);
            }
            cv_.notify_all();
        };
    }

    /**
     * @brief Run @p fn for every later event, on the delivery thread
     */
    auto on_event(std::function<void(const event&)> fn) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        on_event_ = std::make_shared<std::function<void(const event&)>>(std::move(fn));
    }

    template <typename T>
    auto of_type() const -> std::vector<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        for (const auto& e : events_) {
            if (const auto* typed = std::get_if<T>(&e)) {
                out.push_back(*typed);
            }
        }
        return out;
    }

    auto connectivity_states(const provider_handle& handle) const
        -> std::vector<connection_state> {
        std::vector<connection_state> states;
        for (const auto& e : of_type<connectivity_event>()) {
            if (e.handle == handle) {
                states.push_back(e.state);
            }
        }
        return states;
    }

    template <typename Pred>
    auto wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds{5})
        -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return pred(events_); });
    }

    auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<event> events_;
    std::shared_ptr<std::function<void(const event&)>> on_event_;
};

/**
 * @brief Retry policy with short delays for tests
 */
inline auto fast_retry(uint32_t retries = 3) -> retry_policy {
    retry_policy policy;
    policy.max_retries = retries;
    policy.initial_delay = std::chrono::milliseconds{5};
    policy.max_delay = std::chrono::milliseconds{40};
    return policy;
}

/**
 * @brief Core wired to an in-memory SFTP server and a temp directory
 */
class RemoteFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        server_ = std::make_shared<memory_sftp_server>();
        server_->add_directory("/srv");
        factory_ = std::make_shared<memory_session_factory>(server_, "secret");

        credentials_ = std::make_shared<sftp::static_credential_store>();
        sftp::credential secret;
        secret.password = "secret";
        credentials_->add("cred", secret);

        endpoint_.host = "sftp.example.org";
        endpoint_.port = 22;
        endpoint_.username = "alice";
        endpoint_.credential = credential_ref{"cred"};
        endpoint_.initial_path = "/";

        auto core_result = configure(file_manager_core::builder()).build();
        ASSERT_TRUE(core_result.has_value()) << core_result.error().describe();
        core_ = std::make_unique<file_manager_core>(std::move(core_result.value()));
        (void)core_->subscribe(recorder_.handler());
    }

    void TearDown() override {
        core_.reset();
        TempDirectoryFixture::TearDown();
    }

    /**
     * @brief Builder settings; override to change the core under test
     */
    virtual auto configure(file_manager_core::builder builder) -> file_manager_core::builder {
        return builder.with_worker_count(4)
            .with_chunk_size(4 * 1024)
            .with_retry_policy(fast_retry())
            .with_heartbeat(std::chrono::milliseconds{0}, std::chrono::milliseconds{500})
            .with_session_factory(factory_)
            .with_credential_store(credentials_);
    }

    auto connect() -> provider_handle {
        auto handle = core_->connect(endpoint_);
        EXPECT_TRUE(handle.has_value()) << handle.error().describe();
        return handle.has_value() ? handle.value() : provider_handle{};
    }

    /**
     * @brief Submit @p request and wait for its result
     */
    auto run(const result<operation_request>& request,
             std::chrono::milliseconds timeout = std::chrono::seconds{10})
        -> operation_result {
        EXPECT_TRUE(request.has_value()) << request.error().describe();
        if (!request.has_value()) {
            return {};
        }
        auto id = core_->submit(request.value());
        auto done = core_->wait(id, timeout);
        EXPECT_TRUE(done.has_value()) << "request " << id.to_string() << " did not finish";
        return done.value_or(operation_result{});
    }

    static auto local() -> provider_handle { return file_manager_core::local_handle(); }

    std::shared_ptr<memory_sftp_server> server_;
    std::shared_ptr<memory_session_factory> factory_;
    std::shared_ptr<sftp::static_credential_store> credentials_;
    remote_endpoint endpoint_;
    event_recorder recorder_;
    std::unique_ptr<file_manager_core> core_;
};

}  // namespace kcenon::unified_fs::test

#endif  // KCENON_UNIFIED_FS_TESTS_SUPPORT_TEST_FIXTURES_H
