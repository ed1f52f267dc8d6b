/**
 * @file test_conflict_resolver.cpp
 * @brief Unit tests for conflict_resolver
 */

#include "../../support/test_fixtures.h"

#include <kcenon/unified_fs/provider/local_provider.h>
#include <kcenon/unified_fs/transfer/conflict_resolver.h>

namespace kcenon::unified_fs::test {

namespace {

auto existing_entry() -> entry_metadata {
    return entry_metadata(file_manager_core::local_handle(), "/dst", "a.txt", entry_kind::file, 1,
                          file_time{}, 0644);
}

}  // namespace

TEST(ConflictResolverPolicyTest, FixedPoliciesDecideAlone) {
    EXPECT_EQ(conflict_resolver(request_id{1}, overwrite_policy::skip, nullptr)
                  .decide_without_prompt(),
              conflict_action::skip);
    EXPECT_EQ(conflict_resolver(request_id{1}, overwrite_policy::overwrite, nullptr)
                  .decide_without_prompt(),
              conflict_action::overwrite);
    EXPECT_EQ(conflict_resolver(request_id{1}, overwrite_policy::rename_with_suffix, nullptr)
                  .decide_without_prompt(),
              conflict_action::rename);
    EXPECT_FALSE(conflict_resolver(request_id{1}, overwrite_policy::prompt, nullptr)
                     .decide_without_prompt()
                     .has_value());
}

TEST(ConflictResolverPolicyTest, ApplyToAllBecomesSticky) {
    conflict_resolver resolver(request_id{1}, overwrite_policy::prompt, nullptr);

    resolver.record(conflict_decision{conflict_action::overwrite, false});
    EXPECT_FALSE(resolver.decide_without_prompt().has_value());

    resolver.record(conflict_decision{conflict_action::rename, true});
    EXPECT_EQ(resolver.decide_without_prompt(), conflict_action::rename);

    // The first sticky answer wins
    resolver.record(conflict_decision{conflict_action::skip, true});
    EXPECT_EQ(resolver.decide_without_prompt(), conflict_action::rename);
}

TEST(ConflictResolverPolicyTest, StickyAnswerIgnoredForFixedPolicy) {
    conflict_resolver resolver(request_id{1}, overwrite_policy::skip, nullptr);
    resolver.record(conflict_decision{conflict_action::overwrite, true});
    EXPECT_EQ(resolver.decide_without_prompt(), conflict_action::skip);
}

TEST(ConflictResolverPromptTest, NoBusMeansNoPrompt) {
    conflict_resolver resolver(request_id{1}, overwrite_policy::prompt, nullptr);
    EXPECT_EQ(resolver.ask("/a", "/b", existing_entry()), nullptr);
}

TEST(ConflictResolverPromptTest, NoSubscriberMeansNoPrompt) {
    event_bus bus;
    conflict_resolver resolver(request_id{1}, overwrite_policy::prompt, &bus);
    EXPECT_EQ(resolver.ask("/a", "/b", existing_entry()), nullptr);
}

TEST(ConflictResolverPromptTest, PublishesDecisionRequest) {
    event_bus bus;
    event_recorder recorder;
    recorder.on_event([](const event& e) {
        if (const auto* prompt = std::get_if<decision_request_event>(&e)) {
            (void)prompt->respond(conflict_decision{conflict_action::overwrite, false});
        }
    });
    (void)bus.subscribe(recorder.handler());

    conflict_resolver resolver(request_id{42}, overwrite_policy::prompt, &bus);
    auto channel = resolver.ask("/src/a.txt", "/dst/a.txt", existing_entry());
    ASSERT_NE(channel, nullptr);

    auto decision = channel->wait_for(std::chrono::seconds{5});
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->action, conflict_action::overwrite);

    ASSERT_TRUE(bus.flush());
    auto prompts = recorder.of_type<decision_request_event>();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0].request, request_id{42});
    EXPECT_EQ(prompts[0].source_path, "/src/a.txt");
    EXPECT_EQ(prompts[0].destination_path, "/dst/a.txt");
    EXPECT_TRUE(prompts[0].existing.has_value());
}

class FreeNameTest : public TempDirectoryFixture {
protected:
    local_provider provider_;
};

TEST_F(FreeNameTest, FirstFreeSuffix) {
    write_file("report.pdf", "a");
    auto name = conflict_resolver::free_name(provider_, path("report.pdf"));
    ASSERT_TRUE(name.has_value()) << name.error().describe();
    EXPECT_EQ(name.value(), path("report (1).pdf"));
}

TEST_F(FreeNameTest, SkipsTakenSuffixes) {
    write_file("report.pdf", "a");
    write_file("report (1).pdf", "b");
    write_file("report (2).pdf", "c");
    auto name = conflict_resolver::free_name(provider_, path("report.pdf"));
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name.value(), path("report (3).pdf"));
}

TEST_F(FreeNameTest, NameWithoutExtension) {
    std::filesystem::create_directories(test_dir_ / "photos");
    auto name = conflict_resolver::free_name(provider_, path("photos"));
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name.value(), path("photos (1)"));
}

}  // namespace kcenon::unified_fs::test
