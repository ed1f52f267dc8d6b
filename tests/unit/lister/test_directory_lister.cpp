/**
 * @file test_directory_lister.cpp
 * @brief Unit tests for directory_lister and entry_sequence
 */

#include "../../support/test_fixtures.h"

#include <kcenon/unified_fs/lister/directory_lister.h>
#include <kcenon/unified_fs/provider/local_provider.h>
#include <kcenon/unified_fs/provider/provider_registry.h>

#include <set>

namespace kcenon::unified_fs::test {

class DirectoryListerTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        for (int i = 0; i < 7; ++i) {
            write_file("listing/file_" + std::to_string(i) + ".txt", "x");
        }
        std::filesystem::create_directories(test_dir_ / "listing" / "nested");
    }

    auto local() const -> provider_handle { return registry_.local()->handle(); }

    auto names(const std::vector<entry_metadata>& entries) -> std::set<std::string> {
        std::set<std::string> out;
        for (const auto& entry : entries) {
            out.insert(entry.name());
        }
        return out;
    }

    provider_registry registry_{std::make_shared<local_provider>()};
    directory_lister lister_{registry_};
};

TEST_F(DirectoryListerTest, PagesRespectPageSize) {
    auto sequence = lister_.list(local(), path("listing"), 3);
    ASSERT_TRUE(sequence.has_value()) << sequence.error().describe();

    std::vector<std::size_t> sizes;
    std::vector<entry_metadata> all;
    while (true) {
        auto page = sequence.value().next_page();
        ASSERT_TRUE(page.has_value());
        if (page.value().empty()) {
            break;
        }
        sizes.push_back(page.value().size());
        all.insert(all.end(), page.value().begin(), page.value().end());
    }

    EXPECT_EQ(sizes, (std::vector<std::size_t>{3, 3, 2}));
    EXPECT_EQ(all.size(), 8u);
    EXPECT_TRUE(sequence.value().exhausted());
    EXPECT_EQ(sequence.value().consumed(), 8u);
}

TEST_F(DirectoryListerTest, CollectReturnsEveryEntryOnce) {
    auto sequence = lister_.list(local(), path("listing"));
    ASSERT_TRUE(sequence.has_value());
    EXPECT_EQ(sequence.value().page_size(), entry_sequence::default_page_size);

    auto all = sequence.value().collect();
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all.value().size(), 8u);
    EXPECT_EQ(names(all.value()).size(), 8u);
    EXPECT_TRUE(names(all.value()).count("nested"));

    for (const auto& entry : all.value()) {
        EXPECT_EQ(entry.owner(), local());
        if (entry.name() == "nested") {
            EXPECT_TRUE(entry.is_directory());
        } else {
            EXPECT_EQ(entry.kind(), entry_kind::file);
            EXPECT_EQ(entry.size(), 1u);
        }
    }
}

TEST_F(DirectoryListerTest, NextAfterExhaustionStaysEmpty) {
    auto sequence = lister_.list(local(), path("listing/nested"));
    ASSERT_TRUE(sequence.has_value());

    auto first = sequence.value().next();
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first.value().has_value());

    auto again = sequence.value().next();
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again.value().has_value());
}

TEST_F(DirectoryListerTest, RestartStartsOver) {
    auto sequence = lister_.list(local(), path("listing"), 5);
    ASSERT_TRUE(sequence.has_value());
    ASSERT_TRUE(sequence.value().next_page().has_value());
    EXPECT_EQ(sequence.value().consumed(), 5u);

    ASSERT_TRUE(sequence.value().restart().has_value());
    EXPECT_EQ(sequence.value().consumed(), 0u);
    EXPECT_FALSE(sequence.value().exhausted());

    auto all = sequence.value().collect();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all.value().size(), 8u);
}

TEST_F(DirectoryListerTest, RestartSeesNewEntries) {
    auto sequence = lister_.list(local(), path("listing"));
    ASSERT_TRUE(sequence.has_value());
    ASSERT_TRUE(sequence.value().collect().has_value());

    write_file("listing/late.txt", "late");
    ASSERT_TRUE(sequence.value().restart().has_value());
    auto all = sequence.value().collect();
    ASSERT_TRUE(all.has_value());
    EXPECT_TRUE(names(all.value()).count("late.txt"));
}

TEST_F(DirectoryListerTest, MissingDirectoryFailsImmediately) {
    auto sequence = lister_.list(local(), path("absent"));
    ASSERT_FALSE(sequence.has_value());
    EXPECT_EQ(sequence.error().code, error_code::not_found);
}

TEST_F(DirectoryListerTest, ListingAFileIsNotADirectory) {
    auto sequence = lister_.list(local(), path("listing/file_0.txt"));
    ASSERT_FALSE(sequence.has_value());
    EXPECT_EQ(sequence.error().code, error_code::not_a_directory);
}

TEST_F(DirectoryListerTest, UnknownProvider) {
    remote_endpoint endpoint;
    endpoint.host = "gone.example.org";
    auto sequence = lister_.list(provider_handle(99, endpoint), "/");
    ASSERT_FALSE(sequence.has_value());
    EXPECT_EQ(sequence.error().code, error_code::connectivity_error);
}

}  // namespace kcenon::unified_fs::test
