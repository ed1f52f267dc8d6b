/**
 * @file test_operation_executor.cpp
 * @brief Unit tests for list, remove, rename and mkdir execution
 */

#include "../../support/test_fixtures.h"

#include <kcenon/unified_fs/provider/local_provider.h>
#include <kcenon/unified_fs/provider/provider_registry.h>
#include <kcenon/unified_fs/queue/operation_executor.h>
#include <kcenon/unified_fs/transfer/transfer_engine.h>

namespace kcenon::unified_fs::test {

class OperationExecutorTest : public TempDirectoryFixture {
protected:
    void TearDown() override {
        events_.stop();
        TempDirectoryFixture::TearDown();
    }

    static auto local() -> provider_handle { return provider_handle::local(); }

    auto execute(const result<operation_request>& request,
                 const cancellation_token& token = cancellation_token{}) -> operation_result {
        EXPECT_TRUE(request.has_value()) << request.error().describe();
        if (!request) {
            return {};
        }
        return executor_.execute(request.value().with_id(request_id{3}), token);
    }

    auto rename(const std::string& from, const std::string& to,
                overwrite_policy policy = overwrite_policy::prompt) {
        return operation_request::builder(operation_kind::rename)
            .add_source(local(), path(from))
            .with_destination(local(), path(to))
            .with_overwrite(policy)
            .build();
    }

    event_recorder recorder_;
    event_bus events_;
    provider_registry registry_{std::make_shared<local_provider>(2)};
    transfer_engine engine_{registry_, events_};
    operation_executor executor_{registry_, events_, engine_};
};

// ============================================================================
// list
// ============================================================================

TEST_F(OperationExecutorTest, List_ReturnsEntries) {
    write_file("dir/a.txt", "a");
    write_file("dir/b.txt", "bb");
    auto result = execute(
        operation_request::builder(operation_kind::list).add_source(local(), path("dir")).build());
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_EQ(result.kind, operation_kind::list);
    ASSERT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.items[0].outcome, item_outcome::succeeded);
    EXPECT_EQ(result.entries.size(), 2u);
}

TEST_F(OperationExecutorTest, List_MissingDirectoryFails) {
    auto result = execute(
        operation_request::builder(operation_kind::list).add_source(local(), path("nope")).build());
    EXPECT_EQ(result.status, operation_status::failed);
    EXPECT_EQ(result.items[0].reason->code, error_code::not_found);
    EXPECT_TRUE(result.entries.empty());
}

// ============================================================================
// remove
// ============================================================================

TEST_F(OperationExecutorTest, Remove_FilesAndEmptyDirectory) {
    write_file("a.txt", "a");
    std::filesystem::create_directories(test_dir_ / "empty");
    auto result = execute(operation_request::builder(operation_kind::remove)
                              .add_source(local(), path("a.txt"))
                              .add_source(local(), path("empty"))
                              .build());
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_EQ(result.count(item_outcome::succeeded), 2u);
    EXPECT_FALSE(exists("a.txt"));
    EXPECT_FALSE(exists("empty"));
}

TEST_F(OperationExecutorTest, Remove_NonEmptyDirectoryNeedsRecursive) {
    write_file("tree/a.txt", "a");
    auto result = execute(operation_request::builder(operation_kind::remove)
                              .add_source(local(), path("tree"))
                              .build());
    EXPECT_EQ(result.status, operation_status::failed);
    EXPECT_EQ(result.items[0].reason->code, error_code::directory_not_empty);
    EXPECT_TRUE(exists("tree/a.txt"));
}

TEST_F(OperationExecutorTest, Remove_RecursiveTree) {
    write_file("tree/a.txt", "a");
    write_file("tree/sub/b.txt", "b");
    std::filesystem::create_directories(test_dir_ / "tree/sub/deeper");
    auto result = execute(operation_request::builder(operation_kind::remove)
                              .add_source(local(), path("tree"))
                              .with_recursive(true)
                              .build());
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_FALSE(exists("tree"));
}

TEST_F(OperationExecutorTest, Remove_SymlinkNotFollowed) {
    write_file("target/keep.txt", "keep");
    std::filesystem::create_directory_symlink(test_dir_ / "target", test_dir_ / "link");
    auto result = execute(operation_request::builder(operation_kind::remove)
                              .add_source(local(), path("link"))
                              .with_recursive(true)
                              .build());
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_FALSE(exists("link"));
    EXPECT_TRUE(exists("target/keep.txt"));
}

TEST_F(OperationExecutorTest, Remove_MixedOutcomes) {
    write_file("a.txt", "a");
    auto result = execute(operation_request::builder(operation_kind::remove)
                              .add_source(local(), path("a.txt"))
                              .add_source(local(), path("missing.txt"))
                              .build());
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_EQ(result.count(item_outcome::succeeded), 1u);
    EXPECT_EQ(result.count(item_outcome::failed), 1u);
}

TEST_F(OperationExecutorTest, Remove_CancelledBeforeStart) {
    write_file("a.txt", "a");
    cancellation_token token;
    token.cancel();
    auto result = execute(operation_request::builder(operation_kind::remove)
                              .add_source(local(), path("a.txt"))
                              .build(),
                          token);
    EXPECT_EQ(result.status, operation_status::cancelled);
    EXPECT_TRUE(exists("a.txt"));
}

// ============================================================================
// rename
// ============================================================================

TEST_F(OperationExecutorTest, Rename_Simple) {
    write_file("old.txt", "content");
    auto result = execute(rename("old.txt", "new.txt"));
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_EQ(result.items[0].destination, path("new.txt"));
    EXPECT_EQ(read_file("new.txt"), "content");
    EXPECT_FALSE(exists("old.txt"));
}

TEST_F(OperationExecutorTest, Rename_ToSameNameIsNoOp) {
    write_file("same.txt", "content");
    auto result = execute(rename("same.txt", "same.txt"));
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_EQ(read_file("same.txt"), "content");
}

TEST_F(OperationExecutorTest, Rename_CollisionWithSkip) {
    write_file("a.txt", "a");
    write_file("b.txt", "b");
    auto result = execute(rename("a.txt", "b.txt", overwrite_policy::skip));
    EXPECT_EQ(result.items[0].outcome, item_outcome::skipped);
    EXPECT_EQ(read_file("a.txt"), "a");
    EXPECT_EQ(read_file("b.txt"), "b");
}

TEST_F(OperationExecutorTest, Rename_CollisionWithOverwrite) {
    write_file("a.txt", "a");
    write_file("b.txt", "b");
    auto result = execute(rename("a.txt", "b.txt", overwrite_policy::overwrite));
    EXPECT_EQ(result.items[0].outcome, item_outcome::succeeded);
    EXPECT_EQ(read_file("b.txt"), "a");
    EXPECT_FALSE(exists("a.txt"));
}

TEST_F(OperationExecutorTest, Rename_CollisionWithSuffix) {
    write_file("draft.txt", "new");
    write_file("final.txt", "old");
    auto result = execute(rename("draft.txt", "final.txt", overwrite_policy::rename_with_suffix));
    EXPECT_EQ(result.items[0].outcome, item_outcome::succeeded);
    EXPECT_EQ(result.items[0].destination, path("final (1).txt"));
    EXPECT_EQ(read_file("final (1).txt"), "new");
    EXPECT_EQ(read_file("final.txt"), "old");
}

TEST_F(OperationExecutorTest, Rename_PromptWithoutSubscriberSkips) {
    write_file("a.txt", "a");
    write_file("b.txt", "b");
    auto result = execute(rename("a.txt", "b.txt"));
    EXPECT_EQ(result.items[0].outcome, item_outcome::skipped);
    EXPECT_EQ(result.items[0].reason->code, error_code::name_collision);
}

TEST_F(OperationExecutorTest, Rename_PromptAnswered) {
    write_file("a.txt", "a");
    write_file("b.txt", "b");
    recorder_.on_event([](const event& e) {
        if (const auto* prompt = std::get_if<decision_request_event>(&e)) {
            (void)prompt->respond(conflict_decision{conflict_action::rename, false});
        }
    });
    (void)events_.subscribe(recorder_.handler());

    auto result = execute(rename("a.txt", "b.txt"));
    EXPECT_EQ(result.items[0].outcome, item_outcome::succeeded);
    EXPECT_EQ(read_file("b (1).txt"), "a");
}

TEST_F(OperationExecutorTest, Rename_PromptDeclinedFails) {
    write_file("a.txt", "a");
    write_file("b.txt", "b");
    recorder_.on_event([](const event& e) {
        if (const auto* prompt = std::get_if<decision_request_event>(&e)) {
            (void)prompt->respond(conflict_decision{conflict_action::skip, false});
        }
    });
    (void)events_.subscribe(recorder_.handler());

    auto result = execute(rename("a.txt", "b.txt"));
    ASSERT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.items[0].outcome, item_outcome::failed);
    ASSERT_TRUE(result.items[0].reason.has_value());
    EXPECT_EQ(result.items[0].reason->code, error_code::name_collision);
    EXPECT_EQ(read_file("a.txt"), "a");
    EXPECT_EQ(read_file("b.txt"), "b");
}

TEST_F(OperationExecutorTest, Rename_PromptCancelled) {
    write_file("a.txt", "a");
    write_file("b.txt", "b");
    recorder_.on_event([](const event& e) {
        if (const auto* prompt = std::get_if<decision_request_event>(&e)) {
            (void)prompt->respond(conflict_decision{conflict_action::cancel, false});
        }
    });
    (void)events_.subscribe(recorder_.handler());

    cancellation_token token;
    auto result = execute(rename("a.txt", "b.txt"), token);
    EXPECT_EQ(result.status, operation_status::cancelled);
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_TRUE(exists("a.txt"));
}

TEST_F(OperationExecutorTest, Rename_MissingSource) {
    auto result = execute(rename("ghost.txt", "b.txt"));
    EXPECT_EQ(result.status, operation_status::failed);
    EXPECT_EQ(result.items[0].reason->code, error_code::not_found);
}

// ============================================================================
// mkdir and dispatch
// ============================================================================

TEST_F(OperationExecutorTest, Mkdir_CreatesDirectory) {
    auto result = execute(
        operation_request::builder(operation_kind::mkdir).add_source(local(), path("fresh")).build());
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "fresh"));
}

TEST_F(OperationExecutorTest, Mkdir_ExistingNameCollides) {
    std::filesystem::create_directories(test_dir_ / "taken");
    auto result = execute(
        operation_request::builder(operation_kind::mkdir).add_source(local(), path("taken")).build());
    EXPECT_EQ(result.status, operation_status::failed);
    EXPECT_EQ(result.items[0].reason->code, error_code::name_collision);
}

TEST_F(OperationExecutorTest, Mkdir_RecursiveCreatesParents) {
    auto result = execute(operation_request::builder(operation_kind::mkdir)
                              .add_source(local(), path("x/y/z"))
                              .with_recursive(true)
                              .build());
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "x/y/z"));
}

TEST_F(OperationExecutorTest, CopyIsDelegatedToTransferEngine) {
    write_file("src/a.txt", "payload");
    auto result = execute(operation_request::builder(operation_kind::copy)
                              .add_source(local(), path("src/a.txt"))
                              .with_destination(local(), path("dst"))
                              .build());
    EXPECT_EQ(result.status, operation_status::completed);
    EXPECT_EQ(result.kind, operation_kind::copy);
    EXPECT_EQ(read_file("dst/a.txt"), "payload");
}

}  // namespace kcenon::unified_fs::test
