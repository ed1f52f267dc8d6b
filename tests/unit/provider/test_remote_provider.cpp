/**
 * @file test_remote_provider.cpp
 * @brief Unit tests for remote_provider over an in-memory SFTP session
 */

#include "../../support/test_fixtures.h"

#include <kcenon/unified_fs/provider/remote_provider.h>
#include <kcenon/unified_fs/session/remote_connection.h>

#include <cstring>

namespace kcenon::unified_fs::test {

class RemoteProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<memory_sftp_server>();
        server_->add_directory("/srv");

        remote_endpoint ep;
        ep.host = "sftp.example.org";
        ep.username = "alice";
        connection_ = std::make_shared<remote_connection>(provider_handle(1, ep));
        (void)connection_->install(std::make_unique<memory_sftp_session>(server_));
        connection_->set_state(connection_state::ready);
        provider_ = std::make_unique<remote_provider>(connection_, 4);
    }

    static auto bytes_of(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> out(text.size());
        std::memcpy(out.data(), text.data(), text.size());
        return out;
    }

    auto read_all(const std::string& path) -> std::string {
        auto source = provider_->open_for_read(path);
        EXPECT_TRUE(source.has_value());
        if (!source) {
            return {};
        }
        std::string out;
        std::vector<std::byte> buffer(5);
        while (true) {
            auto n = source.value()->read(buffer);
            EXPECT_TRUE(n.has_value());
            if (!n || n.value() == 0) {
                return out;
            }
            out.append(reinterpret_cast<const char*>(buffer.data()), n.value());
        }
    }

    std::shared_ptr<memory_sftp_server> server_;
    std::shared_ptr<remote_connection> connection_;
    std::unique_ptr<remote_provider> provider_;
};

TEST_F(RemoteProviderTest, Capabilities_FollowSessionMultiplexing) {
    EXPECT_EQ(provider_->capabilities().max_concurrency, 1u);
    EXPECT_FALSE(provider_->capabilities().multiplexed);

    server_->set_multiplexed(true);
    (void)connection_->install(std::make_unique<memory_sftp_session>(server_));
    EXPECT_EQ(provider_->capabilities().max_concurrency, 4u);
    EXPECT_TRUE(provider_->capabilities().multiplexed);
}

TEST_F(RemoteProviderTest, List_OmitsDotEntries) {
    server_->add_file("/srv/b.txt", "bb");
    server_->add_file("/srv/a.txt", "a");
    server_->add_directory("/srv/sub");

    auto entries = provider_->list("/srv");
    ASSERT_TRUE(entries.has_value()) << entries.error().describe();
    ASSERT_EQ(entries.value().size(), 3u);
    for (const auto& entry : entries.value()) {
        EXPECT_NE(entry.name(), ".");
        EXPECT_NE(entry.name(), "..");
        EXPECT_EQ(entry.parent(), "/srv");
        EXPECT_EQ(entry.owner(), provider_->handle());
    }
}

TEST_F(RemoteProviderTest, List_ReportsSymlinkTargets) {
    server_->add_symlink("/srv/current", "/srv/releases/7");

    auto entries = provider_->list("/srv");
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries.value().size(), 1u);
    EXPECT_TRUE(entries.value()[0].is_symlink());
    EXPECT_EQ(entries.value()[0].link_target(), std::optional<std::string>("/srv/releases/7"));
}

TEST_F(RemoteProviderTest, Stat_NormalizesPath) {
    server_->add_file("/srv/data/report.pdf", "pdf");
    auto meta = provider_->stat("/srv//data/./report.pdf");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta.value().path(), "/srv/data/report.pdf");
    EXPECT_EQ(meta.value().size(), 3u);
}

TEST_F(RemoteProviderTest, Stat_MissingIsNotFound) {
    auto meta = provider_->stat("/srv/nothing");
    ASSERT_FALSE(meta.has_value());
    EXPECT_EQ(meta.error().code, error_code::not_found);
}

TEST_F(RemoteProviderTest, WriteThenRead) {
    auto sink = provider_->open_for_write("/srv/new.txt", write_mode::truncate);
    ASSERT_TRUE(sink.has_value());
    ASSERT_TRUE(sink.value()->write(bytes_of("hello remote")).has_value());
    ASSERT_TRUE(sink.value()->commit().has_value());
    sink.value().reset();

    EXPECT_EQ(server_->content("/srv/new.txt"), std::optional<std::string>("hello remote"));
    EXPECT_EQ(read_all("/srv/new.txt"), "hello remote");
}

TEST_F(RemoteProviderTest, Write_AfterCommitIsRejected) {
    auto sink = provider_->open_for_write("/srv/once.txt", write_mode::truncate);
    ASSERT_TRUE(sink.has_value());
    ASSERT_TRUE(sink.value()->commit().has_value());
    auto late = sink.value()->write(bytes_of("late"));
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code, error_code::invalid_argument);
}

TEST_F(RemoteProviderTest, Rename_ReplaceRemovesTargetFirst) {
    server_->add_file("/srv/a", "new");
    server_->add_file("/srv/b", "old");

    auto refused = provider_->rename("/srv/a", "/srv/b", false);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, error_code::name_collision);

    ASSERT_TRUE(provider_->rename("/srv/a", "/srv/b", true).has_value());
    EXPECT_FALSE(server_->exists("/srv/a"));
    EXPECT_EQ(server_->content("/srv/b"), std::optional<std::string>("new"));
}

TEST_F(RemoteProviderTest, Remove_FileAndDirectory) {
    server_->add_file("/srv/d/f", "x");

    auto busy = provider_->remove("/srv/d");
    ASSERT_FALSE(busy.has_value());
    EXPECT_EQ(busy.error().code, error_code::directory_not_empty);

    ASSERT_TRUE(provider_->remove("/srv/d/f").has_value());
    ASSERT_TRUE(provider_->remove("/srv/d").has_value());
    EXPECT_FALSE(server_->exists("/srv/d"));
}

TEST_F(RemoteProviderTest, Mkdir_RecursiveCreatesParents) {
    ASSERT_TRUE(provider_->mkdir("/srv/a/b/c", true).has_value());
    EXPECT_EQ(server_->kind("/srv/a/b"), std::optional<entry_kind>(entry_kind::directory));
    EXPECT_TRUE(provider_->mkdir("/srv/a/b/c", true).has_value());

    auto again = provider_->mkdir("/srv/a", false);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::name_collision);
}

TEST_F(RemoteProviderTest, Mkdir_ThroughFileIsNotADirectory) {
    server_->add_file("/srv/plain", "x");
    auto made = provider_->mkdir("/srv/plain/child", true);
    ASSERT_FALSE(made.has_value());
    EXPECT_EQ(made.error().code, error_code::not_a_directory);
}

TEST_F(RemoteProviderTest, SetModifiedTime) {
    server_->add_file("/srv/t", "t");
    auto when = std::chrono::system_clock::time_point(std::chrono::seconds(1'500'000'000));
    ASSERT_TRUE(provider_->set_modified_time("/srv/t", when).has_value());
    EXPECT_EQ(server_->modified("/srv/t"), std::optional<file_time>(when));
}

TEST_F(RemoteProviderTest, DisconnectedSessionFailsWithConnectivityError) {
    connection_->release();
    auto meta = provider_->stat("/srv");
    ASSERT_FALSE(meta.has_value());
    EXPECT_EQ(meta.error().code, error_code::connectivity_error);
}

TEST_F(RemoteProviderTest, HandlesFromOldSessionAreRejected) {
    server_->add_file("/srv/big", std::string(100, 'x'));
    auto source = provider_->open_for_read("/srv/big");
    ASSERT_TRUE(source.has_value());

    (void)connection_->install(std::make_unique<memory_sftp_session>(server_));

    std::vector<std::byte> buffer(10);
    auto n = source.value()->read(buffer);
    ASSERT_FALSE(n.has_value());
    EXPECT_EQ(n.error().code, error_code::connectivity_error);
}

}  // namespace kcenon::unified_fs::test
