/**
 * @file test_path_identity.cpp
 * @brief Unit tests for path normalization, joining and collision names
 */

#include <gtest/gtest.h>

#include <kcenon/unified_fs/core/path_identity.h>

namespace kcenon::unified_fs::test {

class PathIdentityTest : public ::testing::Test {
protected:
    static constexpr auto remote = provider_kind::remote;
    static constexpr auto local = provider_kind::local;

    static auto remote_handle(uint64_t id) -> provider_handle {
        remote_endpoint ep;
        ep.host = "sftp.example.org";
        ep.username = "alice";
        return provider_handle(id, ep);
    }
};

// Normalization

TEST_F(PathIdentityTest, Normalize_RemoteCollapsesComponents) {
    EXPECT_EQ(path_identity::normalize(remote, "/srv//data/./in/.."), "/srv/data");
    EXPECT_EQ(path_identity::normalize(remote, "/srv/data/"), "/srv/data");
    EXPECT_EQ(path_identity::normalize(remote, ""), "/");
    EXPECT_EQ(path_identity::normalize(remote, "/.."), "/");
}

TEST_F(PathIdentityTest, Normalize_RemoteIsAlwaysAbsolute) {
    EXPECT_EQ(path_identity::normalize(remote, "srv/data"), "/srv/data");
}

TEST_F(PathIdentityTest, Normalize_Local) {
    EXPECT_EQ(path_identity::normalize(local, "/home/me/./docs/../pics/"), "/home/me/pics");
    EXPECT_EQ(path_identity::normalize(local, ""), ".");
    EXPECT_EQ(path_identity::normalize(local, "/"), "/");
}

// Join / parent / filename

TEST_F(PathIdentityTest, Join) {
    EXPECT_EQ(path_identity::join(remote, "/srv", "a/b.txt"), "/srv/a/b.txt");
    EXPECT_EQ(path_identity::join(remote, "/", "a"), "/a");
    EXPECT_EQ(path_identity::join(remote, "/srv/", ""), "/srv");
    EXPECT_EQ(path_identity::join(local, "/tmp/x", "y"), "/tmp/x/y");
}

TEST_F(PathIdentityTest, ParentAndFilename) {
    EXPECT_EQ(path_identity::parent(remote, "/srv/data/report.pdf"), "/srv/data");
    EXPECT_EQ(path_identity::parent(remote, "/srv"), "/");
    EXPECT_EQ(path_identity::parent(remote, "/"), "/");
    EXPECT_EQ(path_identity::filename(remote, "/srv/data/report.pdf"), "report.pdf");
    EXPECT_EQ(path_identity::filename(remote, "/"), "");
}

// Containment

TEST_F(PathIdentityTest, Relative) {
    EXPECT_EQ(path_identity::relative(remote, "/srv", "/srv/a/b"), std::optional<std::string>("a/b"));
    EXPECT_EQ(path_identity::relative(remote, "/srv", "/srv"), std::optional<std::string>(""));
    EXPECT_EQ(path_identity::relative(remote, "/", "/etc"), std::optional<std::string>("etc"));
    EXPECT_FALSE(path_identity::relative(remote, "/srv", "/srvx/a").has_value());
    EXPECT_FALSE(path_identity::relative(remote, "/srv/a", "/srv").has_value());
}

TEST_F(PathIdentityTest, IsWithin) {
    EXPECT_TRUE(path_identity::is_within(local, "/a", "/a/b/c"));
    EXPECT_TRUE(path_identity::is_within(local, "/a", "/a/"));
    EXPECT_FALSE(path_identity::is_within(local, "/a/b", "/a"));
    EXPECT_FALSE(path_identity::is_within(local, "/ab", "/a"));
}

TEST_F(PathIdentityTest, SameEntry_RequiresSameProvider) {
    auto a = remote_handle(1);
    auto b = remote_handle(2);
    EXPECT_TRUE(path_identity::same_entry(a, "/srv/x", a, "/srv/./x/"));
    EXPECT_FALSE(path_identity::same_entry(a, "/srv/x", b, "/srv/x"));
    EXPECT_FALSE(path_identity::same_entry(a, "/srv/x", provider_handle::local(), "/srv/x"));
}

// Collision names

TEST_F(PathIdentityTest, CollisionSuffix) {
    EXPECT_EQ(path_identity::with_collision_suffix("report.pdf", 1), "report (1).pdf");
    EXPECT_EQ(path_identity::with_collision_suffix("archive.tar.gz", 2), "archive.tar (2).gz");
    EXPECT_EQ(path_identity::with_collision_suffix("Makefile", 3), "Makefile (3)");
    EXPECT_EQ(path_identity::with_collision_suffix(".profile", 1), ".profile (1)");
}

TEST_F(PathIdentityTest, ValidFilename) {
    EXPECT_TRUE(path_identity::is_valid_filename("notes.txt"));
    EXPECT_TRUE(path_identity::is_valid_filename(".hidden"));
    EXPECT_FALSE(path_identity::is_valid_filename(""));
    EXPECT_FALSE(path_identity::is_valid_filename("."));
    EXPECT_FALSE(path_identity::is_valid_filename(".."));
    EXPECT_FALSE(path_identity::is_valid_filename("a/b"));
    EXPECT_FALSE(path_identity::is_valid_filename("what?"));
    EXPECT_FALSE(path_identity::is_valid_filename("tab\tname"));
}

TEST_F(PathIdentityTest, DisplayUri) {
    auto handle = remote_handle(1);
    EXPECT_EQ(path_identity::to_display_uri(handle, "/srv//data"),
              "sftp://alice@sftp.example.org:22/srv/data");
    EXPECT_EQ(path_identity::to_display_uri(provider_handle::local(), "/home/me"), "/home/me");
}

}  // namespace kcenon::unified_fs::test
