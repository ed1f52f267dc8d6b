/**
 * @file test_local_provider.cpp
 * @brief Unit tests for local_provider
 */

#include "../../support/test_fixtures.h"

#include <kcenon/unified_fs/provider/local_provider.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace kcenon::unified_fs::test {

class LocalProviderTest : public TempDirectoryFixture {
protected:
    auto bytes_of(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> out(text.size());
        std::memcpy(out.data(), text.data(), text.size());
        return out;
    }

    auto read_all(byte_source& source) -> std::string {
        std::string out;
        std::vector<std::byte> buffer(7);
        while (true) {
            auto n = source.read(buffer);
            EXPECT_TRUE(n.has_value());
            if (!n || n.value() == 0) {
                return out;
            }
            out.append(reinterpret_cast<const char*>(buffer.data()), n.value());
        }
    }

    static auto names(const std::vector<entry_metadata>& entries) -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& e : entries) {
            out.push_back(e.name());
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    local_provider provider_{2};
};

TEST_F(LocalProviderTest, Capabilities) {
    EXPECT_TRUE(provider_.handle().is_local());
    EXPECT_EQ(provider_.capabilities().max_concurrency, 2u);
    EXPECT_TRUE(provider_.capabilities().multiplexed);
}

TEST_F(LocalProviderTest, Stat_File) {
    write_file("a.txt", "hello");
    auto meta = provider_.stat(path("a.txt"));
    ASSERT_TRUE(meta.has_value()) << meta.error().describe();
    EXPECT_TRUE(meta.value().is_file());
    EXPECT_EQ(meta.value().size(), 5u);
    EXPECT_EQ(meta.value().name(), "a.txt");
    EXPECT_EQ(meta.value().path(), path("a.txt"));
}

TEST_F(LocalProviderTest, Stat_MissingIsNotFound) {
    auto meta = provider_.stat(path("missing"));
    ASSERT_FALSE(meta.has_value());
    EXPECT_EQ(meta.error().code, error_code::not_found);
}

TEST_F(LocalProviderTest, Stat_SymlinkIsNotFollowed) {
    write_file("target.txt", "x");
    std::filesystem::create_symlink(test_dir_ / "target.txt", test_dir_ / "link");

    auto meta = provider_.stat(path("link"));
    ASSERT_TRUE(meta.has_value());
    EXPECT_TRUE(meta.value().is_symlink());
    ASSERT_TRUE(meta.value().link_target().has_value());
    EXPECT_EQ(*meta.value().link_target(), path("target.txt"));
}

TEST_F(LocalProviderTest, List_SkipsDotEntries) {
    write_file("dir/one.txt", "1");
    write_file("dir/two.txt", "22");
    std::filesystem::create_directories(test_dir_ / "dir" / "sub");

    auto entries = provider_.list(path("dir"));
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ(names(entries.value()), (std::vector<std::string>{"one.txt", "sub", "two.txt"}));
}

TEST_F(LocalProviderTest, List_NotADirectory) {
    write_file("file.txt", "x");
    auto entries = provider_.list(path("file.txt"));
    ASSERT_FALSE(entries.has_value());
    EXPECT_EQ(entries.error().code, error_code::not_a_directory);
}

TEST_F(LocalProviderTest, ReadWrite_RoundTrip) {
    auto sink = provider_.open_for_write(path("out.bin"), write_mode::truncate);
    ASSERT_TRUE(sink.has_value());
    ASSERT_TRUE(sink.value()->write(bytes_of("first ")).has_value());
    ASSERT_TRUE(sink.value()->write(bytes_of("second")).has_value());
    ASSERT_TRUE(sink.value()->commit().has_value());
    sink.value().reset();

    auto source = provider_.open_for_read(path("out.bin"));
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(read_all(*source.value()), "first second");
}

TEST_F(LocalProviderTest, Write_AppendKeepsContent) {
    write_file("log.txt", "abc");
    auto sink = provider_.open_for_write(path("log.txt"), write_mode::append);
    ASSERT_TRUE(sink.has_value());
    ASSERT_TRUE(sink.value()->write(bytes_of("def")).has_value());
    ASSERT_TRUE(sink.value()->commit().has_value());
    sink.value().reset();

    EXPECT_EQ(read_file("log.txt"), "abcdef");
}

TEST_F(LocalProviderTest, Read_DirectoryIsRejected) {
    std::filesystem::create_directories(test_dir_ / "d");
    auto source = provider_.open_for_read(path("d"));
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::invalid_argument);
}

TEST_F(LocalProviderTest, Remove_NonEmptyDirectory) {
    write_file("d/x", "1");
    auto removed = provider_.remove(path("d"));
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code, error_code::directory_not_empty);

    ASSERT_TRUE(provider_.remove(path("d/x")).has_value());
    ASSERT_TRUE(provider_.remove(path("d")).has_value());
    EXPECT_FALSE(exists("d"));
}

TEST_F(LocalProviderTest, Rename_RefusesExistingTarget) {
    write_file("a", "A");
    write_file("b", "B");

    auto renamed = provider_.rename(path("a"), path("b"), false);
    ASSERT_FALSE(renamed.has_value());
    EXPECT_EQ(renamed.error().code, error_code::name_collision);
    EXPECT_EQ(read_file("b"), "B");

    ASSERT_TRUE(provider_.rename(path("a"), path("b"), true).has_value());
    EXPECT_EQ(read_file("b"), "A");
    EXPECT_FALSE(exists("a"));
}

TEST_F(LocalProviderTest, Mkdir) {
    ASSERT_TRUE(provider_.mkdir(path("x/y/z"), true).has_value());
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "x" / "y" / "z"));

    // Recursive creation of an existing directory is not an error
    EXPECT_TRUE(provider_.mkdir(path("x/y"), true).has_value());

    auto again = provider_.mkdir(path("x"), false);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::name_collision);

    auto orphan = provider_.mkdir(path("missing/child"), false);
    ASSERT_FALSE(orphan.has_value());
    EXPECT_EQ(orphan.error().code, error_code::not_found);
}

TEST_F(LocalProviderTest, SetModifiedTime) {
    write_file("stamp.txt", "t");
    auto when = std::chrono::system_clock::time_point(std::chrono::seconds(1'600'000'000));
    ASSERT_TRUE(provider_.set_modified_time(path("stamp.txt"), when).has_value());

    auto meta = provider_.stat(path("stamp.txt"));
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta.value().modified(), when);
}

TEST_F(LocalProviderTest, Probe) {
    write_file("here", "1");
    auto present = provider_.probe(path("here"));
    ASSERT_TRUE(present.has_value());
    EXPECT_TRUE(present.value().has_value());

    auto absent = provider_.probe(path("gone"));
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(absent.value().has_value());
}

TEST_F(LocalProviderTest, ErrnoMapping) {
    EXPECT_EQ(error_from_errno(ENOENT, "x").code, error_code::not_found);
    EXPECT_EQ(error_from_errno(EACCES, "x").code, error_code::permission_denied);
    EXPECT_EQ(error_from_errno(EEXIST, "x").code, error_code::name_collision);
    EXPECT_EQ(error_from_errno(ENOTEMPTY, "x").code, error_code::directory_not_empty);
    EXPECT_EQ(error_from_errno(ENOTDIR, "x").code, error_code::not_a_directory);
    EXPECT_EQ(error_from_errno(EIO, "x").code, error_code::unknown_failure);
}

}  // namespace kcenon::unified_fs::test
