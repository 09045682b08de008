/*
 * Hook tests - Permitter
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 */
#include <gtest/gtest.h>
#include <permitter/hook/hook.hpp>
#include <permitter/hook/json.hpp>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

using namespace permitter;
using namespace permitter::hook;
namespace fs = std::filesystem;

static const char* kAllowLine = "{\"hookSpecificOutput\":{\"hookEventName\":\"PermissionRequest\",\"decision\":{\"behavior\":\"allow\"}}}\n";
static const char* kAskLine = "{\"hookSpecificOutput\":{\"hookEventName\":\"PermissionRequest\",\"decision\":{\"behavior\":\"ask\"}}}\n";

class HookTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        m_root = fs::temp_directory_path() / ("permitter-hook-" + std::to_string(rd()));
        fs::create_directories(m_root / "project" / ".claude");
        fs::create_directories(m_root / "home" / ".claude");
        std::ofstream out(m_root / "project" / ".claude" / "settings.json");
        out << R"json({"permissions":{"allow":["Bash(npm test:*)","Bash(git add:*)","Bash(rm:*)"],"deny":["Bash(rm -rf:*)"]}})json";
        m_cfg.enabled = true;
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_root, ec);
    }
    HookEnv env() const { return HookEnv{(m_root / "project").string(), (m_root / "home").string()}; }
    static std::string event(const std::string& command, const std::string& tool = "Bash") {
        return "{\"tool_name\":" + json_quote(tool) + ",\"tool_input\":{\"command\":" + json_quote(command) + "}}";
    }
    HookOutcome run(const std::string& input) { return run_hook(input, m_cfg, env(), m_log); }

    fs::path m_root;
    HookConfig m_cfg;
    std::ostringstream m_log;
};

TEST(HookOutput, DecisionLines) {
    EXPECT_EQ(decision_json(Behavior::Allow) + "\n", kAllowLine);
    EXPECT_EQ(decision_json(Behavior::Ask) + "\n", kAskLine);
    auto parsed = parse_json(decision_json(Behavior::Ask));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->get("hookSpecificOutput")->get("decision")->get("behavior")->string, "ask");
}

TEST(HookRequestParse, ToolAlias) {
    auto req = parse_request(R"({"tool":"Bash","tool_input":{"command":"ls"}})");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->tool_name, "Bash");
    EXPECT_EQ(req->command, "ls");
    EXPECT_FALSE(parse_request("[]").has_value());
    EXPECT_FALSE(parse_request("not json").has_value());
    req = parse_request(R"({"tool_name":"Bash","tool_input":{"command":42}})");
    ASSERT_TRUE(req.has_value());
    EXPECT_TRUE(req->command.empty());
}

TEST_F(HookTest, AllowsMatchingCommand) {
    auto out = run(event("API_KEY=x npm test"));
    EXPECT_EQ(out.output, kAllowLine);
    EXPECT_EQ(out.exit_code, 0);
    ASSERT_TRUE(out.verdict.has_value());
    EXPECT_TRUE(out.verdict->allowed());
}

TEST_F(HookTest, AsksOnNoMatch) {
    auto out = run(event("git add . && git commit -m 'msg'"));
    EXPECT_EQ(out.output, kAskLine);
    EXPECT_EQ(out.exit_code, 0);
}

TEST_F(HookTest, DeniedStillAsks) {
    auto out = run(event("rm -rf /tmp/x"));
    EXPECT_EQ(out.behavior, Behavior::Ask);
    EXPECT_EQ(out.output.find("deny"), std::string::npos);
    EXPECT_EQ(out.exit_code, 0);
}

TEST_F(HookTest, ParseErrorExitCodeFollowsStrict) {
    auto out = run(event("npm test; $(bad)"));
    EXPECT_EQ(out.output, kAskLine);
    EXPECT_EQ(out.exit_code, 1);
    m_cfg.strict = false;
    out = run(event("npm test; $(bad)"));
    EXPECT_EQ(out.output, kAskLine);
    EXPECT_EQ(out.exit_code, 0);
}

TEST_F(HookTest, AsksWithoutRunningEngine) {
    for (const std::string& input : {event("npm test", "Read"), event(""), std::string("{bad json"), std::string(""),
                                     std::string(R"({"tool_input":{"command":"npm test"}})")}) {
        auto out = run(input);
        EXPECT_EQ(out.output, kAskLine) << input;
        EXPECT_EQ(out.exit_code, 0) << input;
        EXPECT_FALSE(out.verdict.has_value()) << input;
    }
}

TEST_F(HookTest, DisabledAlwaysAsks) {
    m_cfg.enabled = false;
    auto out = run(event("npm test"));
    EXPECT_EQ(out.output, kAskLine);
    EXPECT_FALSE(out.verdict.has_value());
}

TEST_F(HookTest, ToolAliasAccepted) {
    auto out = run(R"({"tool":"Bash","tool_input":{"command":"npm test --watch"}})");
    EXPECT_EQ(out.output, kAllowLine);
}

TEST_F(HookTest, DebugTraceGoesToLog) {
    m_cfg.debug = true;
    run(event("timeout 30 npm test"));
    std::string log = m_log.str();
    EXPECT_NE(log.find("[PERMITTER] rules: 3 allow, 1 deny"), std::string::npos) << log;
    EXPECT_NE(log.find("[PERMITTER] verdict: Allow"), std::string::npos) << log;

    m_log.str("");
    m_cfg.debug = false;
    run(event("timeout 30 npm test"));
    EXPECT_TRUE(m_log.str().empty());
}

TEST_F(HookTest, NoSettingsFilesAsks) {
    fs::remove(m_root / "project" / ".claude" / "settings.json");
    auto out = run(event("npm test"));
    EXPECT_EQ(out.output, kAskLine);
}
