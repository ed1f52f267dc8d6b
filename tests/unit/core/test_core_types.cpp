/**
 * @file test_core_types.cpp
 * @brief Unit tests for error, result, handles and entry metadata
 */

#include <gtest/gtest.h>

#include <kcenon/unified_fs/core/entry_metadata.h>
#include <kcenon/unified_fs/core/operation_types.h>
#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/types.h>

#include <unordered_set>

namespace kcenon::unified_fs::test {

// =============================================================================
// error / result
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ValueResult) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, ErrorResult) {
    result<int> r = unexpected{error{error_code::not_found, "missing"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::permission_denied}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::permission_denied);
}

TEST_F(ResultTest, ErrorDescribeIncludesCause) {
    error e{error_code::connectivity_error, "read failed", "connection reset"};
    EXPECT_EQ(e.describe(), "connectivity error: read failed (connection reset)");
    EXPECT_TRUE(static_cast<bool>(e));
    EXPECT_FALSE(static_cast<bool>(error{}));
}

TEST_F(ResultTest, OnlyConnectivityIsRetryable) {
    EXPECT_TRUE(is_retryable(error_code::connectivity_error));
    EXPECT_FALSE(is_retryable(error_code::authentication_error));
    EXPECT_FALSE(is_retryable(error_code::not_found));
    EXPECT_FALSE(is_retryable(error_code::permission_denied));
    EXPECT_FALSE(is_retryable(error_code::cancelled));
}

TEST_F(ResultTest, ErrorCodeStrings) {
    EXPECT_STREQ(to_string(error_code::name_collision), "name collision");
    EXPECT_STREQ(to_string(error_code::directory_not_empty), "directory not empty");
    EXPECT_STREQ(to_string(error_code::skipped_directory), "skipped directory");
}

// =============================================================================
// provider_handle
// =============================================================================

class ProviderHandleTest : public ::testing::Test {
protected:
    static auto endpoint() -> remote_endpoint {
        remote_endpoint ep;
        ep.host = "files.example.org";
        ep.port = 2222;
        ep.username = "bob";
        ep.credential = credential_ref{"bob-key"};
        return ep;
    }
};

TEST_F(ProviderHandleTest, LocalHandle) {
    auto local = provider_handle::local();
    EXPECT_TRUE(local.is_local());
    EXPECT_EQ(local.kind(), provider_kind::local);
    EXPECT_EQ(local.label(), "local");
    EXPECT_FALSE(local.endpoint().has_value());
}

TEST_F(ProviderHandleTest, RemoteHandle) {
    provider_handle remote(7, endpoint());
    EXPECT_FALSE(remote.is_local());
    EXPECT_EQ(remote.kind(), provider_kind::remote);
    EXPECT_EQ(remote.id(), 7u);
    EXPECT_EQ(remote.label(), "bob@files.example.org:2222");
}

TEST_F(ProviderHandleTest, EqualityIsById) {
    provider_handle a(3, endpoint());
    provider_handle b(3, endpoint());
    provider_handle c(4, endpoint());
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_FALSE(a == provider_handle::local());
}

TEST_F(ProviderHandleTest, Hashable) {
    std::unordered_set<provider_handle> handles;
    handles.insert(provider_handle::local());
    handles.insert(provider_handle(1, endpoint()));
    handles.insert(provider_handle(1, endpoint()));
    EXPECT_EQ(handles.size(), 2u);
}

// =============================================================================
// entry_metadata
// =============================================================================

class EntryMetadataTest : public ::testing::Test {};

TEST_F(EntryMetadataTest, FileEntry) {
    auto now = std::chrono::system_clock::now();
    entry_metadata entry(provider_handle::local(), "/home/me", "notes.txt", entry_kind::file,
                         120, now, 0644);

    EXPECT_EQ(entry.name(), "notes.txt");
    EXPECT_EQ(entry.parent(), "/home/me");
    EXPECT_EQ(entry.path(), "/home/me/notes.txt");
    EXPECT_EQ(entry.size(), 120u);
    EXPECT_EQ(entry.modified(), now);
    EXPECT_EQ(entry.permissions(), 0644u);
    EXPECT_TRUE(entry.is_file());
    EXPECT_FALSE(entry.is_directory());
    EXPECT_FALSE(entry.link_target().has_value());
}

TEST_F(EntryMetadataTest, EntryBelowRoot) {
    entry_metadata entry(provider_handle::local(), "/", "srv", entry_kind::directory, 0,
                         file_time{}, 0755);
    EXPECT_EQ(entry.path(), "/srv");
    EXPECT_TRUE(entry.is_directory());
}

TEST_F(EntryMetadataTest, SymlinkKeepsTarget) {
    entry_metadata entry(provider_handle::local(), "/tmp", "latest", entry_kind::symlink, 0,
                         file_time{}, 0777, std::string("/var/log/app.log"));
    EXPECT_TRUE(entry.is_symlink());
    ASSERT_TRUE(entry.link_target().has_value());
    EXPECT_EQ(*entry.link_target(), "/var/log/app.log");
}

// =============================================================================
// operation_result
// =============================================================================

class OperationResultTest : public ::testing::Test {};

TEST_F(OperationResultTest, CountsOutcomes) {
    operation_result r;
    r.items.push_back(item_result{"/a", "/b/a", item_outcome::succeeded, std::nullopt, 10});
    r.items.push_back(item_result{"/c", "/b/c", item_outcome::skipped, std::nullopt, 0});
    r.items.push_back(item_result{"/d", "/b/d", item_outcome::succeeded, std::nullopt, 5});

    EXPECT_EQ(r.count(item_outcome::succeeded), 2u);
    EXPECT_EQ(r.count(item_outcome::skipped), 1u);
    EXPECT_EQ(r.count(item_outcome::failed), 0u);
    EXPECT_FALSE(r.all_succeeded());
}

TEST_F(OperationResultTest, EnumStrings) {
    EXPECT_STREQ(to_string(operation_kind::mkdir), "mkdir");
    EXPECT_STREQ(to_string(overwrite_policy::rename_with_suffix), "rename_with_suffix");
    EXPECT_STREQ(to_string(item_outcome::cancelled), "cancelled");
    EXPECT_STREQ(to_string(operation_status::failed), "failed");
    EXPECT_STREQ(to_string(entry_kind::symlink), "symlink");
}

TEST_F(OperationResultTest, RequestIdFormatting) {
    request_id id(12);
    EXPECT_EQ(id.to_string(), "req-12");
    EXPECT_TRUE(request_id(1) < request_id(2));
    EXPECT_EQ(request_id(5), request_id(5));
}

}  // namespace kcenon::unified_fs::test
