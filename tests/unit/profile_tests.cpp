#include <gtest/gtest.h>
#include <tempo/core/clock.hpp>
#include <tempo/core/profile_stack.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

using namespace std::chrono_literals;
using tempo::core::ManualClock;
using tempo::core::ProfileStack;
using tempo::core::StackUnderflow;

class ProfileStackTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<ManualClock>();
        stack = std::make_unique<ProfileStack>(clock);
    }

    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<ProfileStack> stack;
};

TEST_F(ProfileStackTest, FreshStackRendersNothing) {
    auto lines = stack->render();
    EXPECT_TRUE(lines.empty());
    EXPECT_EQ(lines.begin(), lines.end());
    EXPECT_EQ(stack->depth(), 0u);
    EXPECT_EQ(stack->root().name, "session");
}

TEST_F(ProfileStackTest, ExitWithoutEnterThrows) {
    EXPECT_THROW(stack->exit(), StackUnderflow);

    stack->enter("a");
    stack->exit();
    EXPECT_THROW(stack->exit(), StackUnderflow);
    EXPECT_EQ(stack->depth(), 0u);
}

TEST_F(ProfileStackTest, NestedSpansRenderAtTheirDepth) {
    stack->enter("a");
    clock->advance(1ms);
    stack->enter("b");
    clock->advance(2ms);
    auto& b = stack->exit();
    clock->advance(500us);
    auto& a = stack->exit();

    EXPECT_EQ(b.name, "b");
    EXPECT_EQ(b.elapsed, 2ms);
    EXPECT_FALSE(b.open);
    EXPECT_EQ(a.name, "a");
    EXPECT_EQ(a.elapsed, 3500us);

    std::vector<std::string> expected = {
        "  - a: **3.5ms**",
        "    - b: **2ms**",
    };
    EXPECT_EQ(stack->render().to_vector(), expected);

    ASSERT_EQ(stack->root().children.size(), 1u);
    ASSERT_EQ(stack->root().children[0]->children.size(), 1u);
    EXPECT_EQ(stack->root().children[0]->children[0]->name, "b");
}

TEST_F(ProfileStackTest, SiblingOrderFollowsCallOrder) {
    stack->enter("a");
    stack->enter("b");
    stack->exit();
    stack->enter("c");
    stack->enter("c1");
    stack->exit();
    stack->exit();
    stack->exit();
    stack->enter("d");
    stack->exit();

    std::vector<std::string> names;
    std::vector<size_t> depths;
    auto lines = stack->render();
    for (auto it = lines.begin(); it != lines.end(); ++it) {
        names.push_back(it.entry()->name);
        depths.push_back(it.depth());
    }

    EXPECT_EQ(names, (std::vector<std::string>{"a", "b", "c", "c1", "d"}));
    EXPECT_EQ(depths, (std::vector<size_t>{1, 2, 2, 3, 1}));
}

TEST_F(ProfileStackTest, DurationsAreTruncatedNotRounded) {
    stack->enter("slow");
    clock->advance(1234567ns);
    stack->exit();

    stack->enter("almost");
    clock->advance(1999999ns);
    stack->exit();

    auto lines = stack->render().to_vector();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "  - slow: **1.23ms**");
    EXPECT_EQ(lines[1], "  - almost: **1.99ms**");
}

TEST_F(ProfileStackTest, TinySpansAreStillRendered) {
    stack->enter("instant");
    stack->exit();
    stack->enter("sub_us");
    clock->advance(400ns);
    stack->exit();

    auto lines = stack->render().to_vector();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "  - instant: **0ms**");
    EXPECT_EQ(lines[1], "  - sub_us: **0ms**");
}

TEST_F(ProfileStackTest, RenderIsRestartable) {
    stack->enter("a");
    stack->enter("b");
    stack->exit();
    stack->exit();

    auto lines = stack->render();
    std::vector<std::string> first(lines.begin(), lines.end());
    std::vector<std::string> second(lines.begin(), lines.end());
    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(first, second);
}

TEST_F(ProfileStackTest, OpenSpansRenderAsZeroUntilClosed) {
    stack->enter("outer");
    clock->advance(5ms);

    EXPECT_EQ(stack->render().to_vector(), (std::vector<std::string>{"  - outer: **0ms**"}));
    EXPECT_EQ(stack->depth(), 1u);
    EXPECT_EQ(stack->top()->name, "outer");

    stack->exit();
    EXPECT_EQ(stack->render().to_vector(), (std::vector<std::string>{"  - outer: **5ms**"}));
    EXPECT_EQ(stack->top(), nullptr);
}

TEST_F(ProfileStackTest, RecordAttachesWithoutOpening) {
    stack->enter("startup");
    stack->record("plugin", 7500us);
    EXPECT_EQ(stack->depth(), 1u);
    clock->advance(10ms);
    stack->exit();

    auto lines = stack->render().to_vector();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "  - startup: **10ms**");
    EXPECT_EQ(lines[1], "    - plugin: **7.5ms**");

    EXPECT_THROW(stack->record("bad", -1ns), std::invalid_argument);
}

TEST_F(ProfileStackTest, ClearStartsOver) {
    stack->enter("a");
    stack->enter("b");
    auto generation = stack->generation();

    stack->clear();

    EXPECT_EQ(stack->depth(), 0u);
    EXPECT_TRUE(stack->render().empty());
    EXPECT_NE(stack->generation(), generation);
    EXPECT_EQ(stack->root().name, "session");
    EXPECT_THROW(stack->exit(), StackUnderflow);
}

TEST_F(ProfileStackTest, HeldRenderViewEmptiesOnClear) {
    stack->enter("a");
    clock->advance(1ms);
    stack->exit();
    auto lines = stack->render();
    ASSERT_EQ(lines.to_vector().size(), 1u);

    stack->clear();

    size_t seen = 0;
    for (const auto& line : lines) {
        (void)line;
        ++seen;
    }
    EXPECT_EQ(seen, 0u);
    EXPECT_TRUE(lines.empty());

    stack->enter("b");
    stack->exit();
    EXPECT_EQ(lines.to_vector(), (std::vector<std::string>{"  - b: **0ms**"}));
}

TEST_F(ProfileStackTest, StackIsNotMovable) {
    static_assert(!std::is_move_constructible_v<ProfileStack>);
    static_assert(!std::is_move_assignable_v<ProfileStack>);
    EXPECT_EQ(stack->depth(), 0u);
}

TEST_F(ProfileStackTest, CustomRootName) {
    ProfileStack named(clock, "startup");
    EXPECT_EQ(named.root().name, "startup");
    named.enter("x");
    named.exit();
    EXPECT_EQ(named.render().to_vector().size(), 1u);
}

TEST_F(ProfileStackTest, ScopeClosesItsSpan) {
    {
        tempo::core::ProfileScope outer(*stack, "outer");
        clock->advance(1ms);
        {
            tempo::core::ProfileScope inner(*stack, "inner");
            clock->advance(2ms);
            EXPECT_EQ(stack->depth(), 2u);
        }
        EXPECT_EQ(stack->depth(), 1u);
    }
    EXPECT_EQ(stack->depth(), 0u);

    std::vector<std::string> expected = {
        "  - outer: **3ms**",
        "    - inner: **2ms**",
    };
    EXPECT_EQ(stack->render().to_vector(), expected);
}

TEST_F(ProfileStackTest, ScopeSurvivesClear) {
    EXPECT_NO_THROW({
        tempo::core::ProfileScope scope(*stack, "doomed");
        stack->clear();
    });
    EXPECT_EQ(stack->depth(), 0u);
    EXPECT_TRUE(stack->render().empty());
}

TEST(ProfileLineTest, FormatsIndentAndDuration) {
    tempo::core::ProfileEntry entry("load");
    entry.elapsed = std::chrono::nanoseconds(12345678);
    EXPECT_EQ(tempo::core::format_profile_line(entry, 1), "  - load: **12.34ms**");
    EXPECT_EQ(tempo::core::format_profile_line(entry, 3), "      - load: **12.34ms**");

    entry.elapsed = std::chrono::seconds(2);
    EXPECT_EQ(tempo::core::format_profile_line(entry, 1), "  - load: **2000ms**");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
