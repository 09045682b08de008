/*
 * Settings loader tests - Permitter
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 */
#include <gtest/gtest.h>
#include <permitter/hook/settings.hpp>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

using namespace permitter::hook;
namespace fs = std::filesystem;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        m_root = fs::temp_directory_path() / ("permitter-settings-" + std::to_string(rd()));
        m_cwd = m_root / "project";
        m_home = m_root / "home";
        fs::create_directories(m_cwd / ".claude");
        fs::create_directories(m_home / ".claude");
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_root, ec);
    }
    void write(const fs::path& p, const std::string& text) {
        std::ofstream out(p, std::ios::binary);
        out << text;
    }
    fs::path local() const { return m_cwd / ".claude" / "settings.local.json"; }
    fs::path project() const { return m_cwd / ".claude" / "settings.json"; }
    fs::path global() const { return m_home / ".claude" / "settings.json"; }

    fs::path m_root, m_cwd, m_home;
};

TEST(SettingsFiles, PriorityOrder) {
    auto files = settings_files("/work/app", "/home/u");
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], "/work/app/.claude/settings.local.json");
    EXPECT_EQ(files[1], "/work/app/.claude/settings.json");
    EXPECT_EQ(files[2], "/home/u/.claude/settings.json");
}

TEST_F(SettingsTest, SingleFile) {
    write(local(), R"json({"permissions":{"allow":["Bash(npm test:*)"],"deny":["Bash(rm:*)"]}})json");
    auto one = load_settings_file(local().string());
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->allow, std::vector<std::string>{"Bash(npm test:*)"});
    EXPECT_EQ(one->deny, std::vector<std::string>{"Bash(rm:*)"});
}

TEST_F(SettingsTest, MissingEmptyMalformed) {
    EXPECT_FALSE(load_settings_file(local().string()).has_value());
    write(local(), "");
    EXPECT_FALSE(load_settings_file(local().string()).has_value());
    write(local(), "{ not json");
    EXPECT_FALSE(load_settings_file(local().string()).has_value());
    write(local(), "[1,2]");
    EXPECT_FALSE(load_settings_file(local().string()).has_value());
}

TEST_F(SettingsTest, MissingOrOddPermissionsYieldNothing) {
    for (const char* text : {R"json({})json", R"json({"permissions":null})json", R"json({"permissions":{"allow":null}})json",
                             R"json({"permissions":{"allow":"Bash(ls)"}})json", R"json({"permissions":{"allow":[]}})json"}) {
        write(local(), text);
        auto one = load_settings_file(local().string());
        ASSERT_TRUE(one.has_value()) << text;
        EXPECT_TRUE(one->allow.empty()) << text;
        EXPECT_TRUE(one->deny.empty()) << text;
    }
}

TEST_F(SettingsTest, NonStringEntriesSkipped) {
    write(local(), R"json({"permissions":{"allow":["Bash(ls:*)", 3, null, {"x":1}, "Bash(pwd)"]}})json");
    auto one = load_settings_file(local().string());
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->allow, (std::vector<std::string>{"Bash(ls:*)", "Bash(pwd)"}));
}

TEST_F(SettingsTest, UnionInFileOrderWithDuplicates) {
    write(local(), R"json({"permissions":{"allow":["Bash(a:*)"],"deny":["Bash(x:*)"]}})json");
    write(project(), R"json({"permissions":{"allow":["Bash(b:*)","Bash(a:*)"]}})json");
    write(global(), R"json({"permissions":{"allow":["Bash(c)"],"deny":["Bash(y:*)"]}})json");
    auto merged = load_rule_literals(settings_files(m_cwd.string(), m_home.string()));
    EXPECT_EQ(merged.allow, (std::vector<std::string>{"Bash(a:*)", "Bash(b:*)", "Bash(a:*)", "Bash(c)"}));
    EXPECT_EQ(merged.deny, (std::vector<std::string>{"Bash(x:*)", "Bash(y:*)"}));
}

TEST_F(SettingsTest, MalformedFileSkippedOthersLoaded) {
    write(local(), "{oops");
    write(global(), R"json({"permissions":{"allow":["Bash(git status)"]}})json");
    std::ostringstream log;
    auto merged = load_rule_literals(settings_files(m_cwd.string(), m_home.string()), &log);
    EXPECT_EQ(merged.allow, std::vector<std::string>{"Bash(git status)"});
    EXPECT_NE(log.str().find("[PERMITTER] settings skipped: " + local().string()), std::string::npos) << log.str();
}

TEST_F(SettingsTest, PermissionSetDropsNonBashRules) {
    write(project(), R"json({"permissions":{"allow":["Bash(npm test:*)","Read(**)","WebFetch(domain:x.com)","Bash()"],
                        "deny":["Bash(rm -rf:*)","Edit(secret)"]}})json");
    auto set = load_permission_set(m_cwd.string(), m_home.string());
    ASSERT_EQ(set.allow.size(), 1u);
    EXPECT_EQ(set.allow[0].pattern, "npm test");
    ASSERT_EQ(set.deny.size(), 1u);
    EXPECT_EQ(set.deny[0].source, "Bash(rm -rf:*)");
}

TEST_F(SettingsTest, RealisticSettingsFile) {
    write(global(), R"json({
  "$schema": "https://json.schemastore.org/claude-code-settings.json",
  "model": "sonnet",
  "permissions": {
    "allow": ["Bash(git status:*)", "Bash(git diff:*)", "Read(~/.zshrc)"],
    "deny": ["Bash(curl:*)"],
    "defaultMode": "default"
  },
  "hooks": {"PermissionRequest": [{"matcher": "Bash", "hooks": [{"type": "command", "command": "permitter-hook"}]}]}
})json");
    auto set = load_permission_set(m_cwd.string(), m_home.string());
    EXPECT_EQ(set.allow.size(), 2u);
    EXPECT_EQ(set.deny.size(), 1u);
}
