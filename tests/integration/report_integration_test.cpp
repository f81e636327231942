// tests/integration/report_integration_test.cpp
#include <gtest/gtest.h>
#include "tempo/core/clock.hpp"
#include "tempo/core/event_loop.hpp"
#include "tempo/core/profile_stack.hpp"
#include "tempo/core/throttle.hpp"
#include "tempo/host/filesystem.hpp"
#include "tempo/host/git_info.hpp"
#include "tempo/host/notifier.hpp"
#include "tempo/host/profile_report.hpp"
#include "tempo/utils/config.hpp"
#include "tempo/utils/dump.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// Mock notification surface
class MockNotifier : public tempo::host::Notifier {
public:
    void notify(const tempo::host::Notification& notification) override {
        messages_.push_back(notification.message);
        if (notification.markdown) {
            markdown_count_++;
        }
    }

    const std::vector<std::string>& messages() const { return messages_; }
    int markdown_count() const { return markdown_count_; }

private:
    std::vector<std::string> messages_;
    int markdown_count_ = 0;
};

// Test fixture
class ReportIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempo::utils::Config::instance()->load_from_string(
            "profile.root_name = startup\n"
            "throttle.cooldown_ms = 100\n"
            "notify.title = tempo\n");

        workspace_ = fs::temp_directory_path() / "tempo_report_integration";
        fs::remove_all(workspace_);
        for (int i = 0; i < 5; ++i) {
            write_file(workspace_ / ("plugin" + std::to_string(i)) / "init.txt", std::to_string(i));
        }
        write_file(workspace_ / ".git/HEAD", "ref: refs/heads/main\n");
        write_file(workspace_ / ".git/refs/heads/main", "abc123\n");

        clock_ = std::make_shared<tempo::core::ManualClock>();
        loop_ = std::make_unique<tempo::core::EventLoop>(clock_);
        auto config = tempo::utils::Config::instance();
        profile_ = std::make_unique<tempo::core::ProfileStack>(
            clock_, config->get(tempo::utils::config_keys::PROFILE_ROOT_NAME, "session"));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(workspace_, ec);
        tempo::utils::Config::instance()->clear();
    }

    static void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

    fs::path workspace_;
    std::shared_ptr<tempo::core::ManualClock> clock_;
    std::unique_ptr<tempo::core::EventLoop> loop_;
    std::unique_ptr<tempo::core::ProfileStack> profile_;
    MockNotifier notifier_;
};

TEST_F(ReportIntegrationTest, ProfiledScanWithThrottledProgress) {
    auto cooldown = std::chrono::milliseconds(
        tempo::utils::Config::instance()->get(tempo::utils::config_keys::THROTTLE_COOLDOWN_MS, 0));

    int progress_updates = 0;
    auto progress = tempo::core::make_throttle(*loop_, cooldown, [&]() {
        ++progress_updates;
        tempo::host::info(notifier_, "progress");
    });

    {
        tempo::core::ProfileScope scan(*profile_, "scan");
        // Five plugins 10ms apart, all inside one 100ms cooldown window
        for (const auto& entry : tempo::host::scandir(workspace_.string())) {
            if (entry.type != tempo::host::EntryType::DIRECTORY) {
                continue;
            }
            if (entry.name == ".git") {
                continue;
            }
            tempo::core::ProfileScope load(*profile_, entry.name);
            clock_->advance(10ms);
            progress();
            loop_->run_once();
        }
    }

    EXPECT_EQ(progress_updates, 1);
    loop_->run();
    EXPECT_EQ(progress_updates, 2);

    {
        tempo::core::ProfileScope git(*profile_, "git");
        auto info = tempo::host::git_info(workspace_.string());
        ASSERT_TRUE(info.has_value());
        EXPECT_EQ(info->branch, "main");
        EXPECT_EQ(info->hash, "abc123");
    }

    tempo::host::show_profile(*profile_, notifier_);

    ASSERT_EQ(notifier_.markdown_count(), 1);
    const std::string& report = notifier_.messages().back();
    EXPECT_EQ(report.rfind("# Profile\n  - scan: **50ms**\n", 0), 0u);
    EXPECT_NE(report.find("    - plugin0: **10ms**"), std::string::npos);
    EXPECT_NE(report.find("    - plugin4: **10ms**"), std::string::npos);
    EXPECT_NE(report.find("\n  - git: **0ms**"), std::string::npos);
    EXPECT_EQ(profile_->root().name, "startup");

    auto lines = tempo::host::profile_report(*profile_);
    EXPECT_EQ(lines.size(), 1u + 1u + 5u + 1u);
}

TEST_F(ReportIntegrationTest, SummaryDumpOfScan) {
    tempo::utils::Value summary = tempo::utils::Value::table();
    size_t directories = 0;
    for (const auto& entry : tempo::host::scandir(workspace_.string())) {
        if (entry.type == tempo::host::EntryType::DIRECTORY) {
            ++directories;
        }
    }
    summary.set("directories", static_cast<double>(directories));
    summary.set("branch", tempo::host::git_info(workspace_.string())->branch);

    EXPECT_EQ(tempo::utils::dump(summary), "{[\"directories\"]=6,[\"branch\"]=\"main\",}");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
