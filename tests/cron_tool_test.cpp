#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "nlohmann/json.hpp"

#include "cron/cron_service.hpp"
#include "test_helpers.hpp"
#include "tools/cron_tool.hpp"

using namespace cronkeeper::cron;
using cronkeeper::testing::TempDir;
using cronkeeper::tools::CronTool;
using Params = std::unordered_map<std::string, std::string>;

namespace {

constexpr long long kStart = 1700000000000LL;

bool IsError(const std::string& output) {
    return output.rfind("Error:", 0) == 0;
}

}  // namespace

class CronToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        CronServiceDeps deps;
        deps.store_path = dir_.file("jobs.json");
        deps.enabled = false;
        deps.now_ms = []() { return kStart; };
        deps.execute_job = [this](const CronJob& job, const CancellationToken&) {
            last_run_ = job;
            ExecutionResult result;
            result.summary = "ran " + job.name;
            return result;
        };
        service_ = std::make_unique<CronService>(std::move(deps));
        tool_ = std::make_unique<CronTool>(service_.get());
    }

    nlohmann::json Call(const Params& params) {
        const auto output = tool_->Execute(params);
        EXPECT_FALSE(IsError(output)) << output;
        return nlohmann::json::parse(output);
    }

    std::string AddReminder(const std::string& name) {
        return Call({{"action", "add"}, {"name", name}, {"mode", "reminder"},
                     {"message", "hello"}, {"every_seconds", "60"}})["id"].get<std::string>();
    }

    TempDir dir_;
    std::unique_ptr<CronService> service_;
    std::unique_ptr<CronTool> tool_;
    std::optional<CronJob> last_run_;
};

// ============================================================================
// Argument handling
// ============================================================================

TEST_F(CronToolTest, DescribesItself) {
    EXPECT_EQ(tool_->Name(), "cron");
    const auto schema = nlohmann::json::parse(tool_->ParametersJson());
    EXPECT_EQ(schema["required"][0], "action");
}

TEST_F(CronToolTest, RejectsMissingOrUnknownAction) {
    EXPECT_EQ(tool_->Execute({}), "Error: action is required");
    EXPECT_EQ(tool_->Execute({{"action", "explode"}, {"id", "x"}}), "Error: unsupported action");
}

TEST_F(CronToolTest, IdIsRequired) {
    EXPECT_EQ(tool_->Execute({{"action", "remove"}}), "Error: id is required");
    EXPECT_EQ(tool_->Execute({{"action", "run"}}), "Error: id is required");
    EXPECT_EQ(tool_->Execute({{"action", "update"}}), "Error: id is required");
}

TEST_F(CronToolTest, NullServiceIsReported) {
    CronTool detached(nullptr);
    EXPECT_TRUE(IsError(detached.Execute({{"action", "list"}})));
}

// ============================================================================
// add
// ============================================================================

TEST_F(CronToolTest, AddReminderEvery) {
    const auto json = Call({{"action", "add"}, {"name", "ping"}, {"mode", "reminder"},
                            {"message", "hello"}, {"every_seconds", "300"}});
    EXPECT_EQ(json["name"], "ping");
    EXPECT_EQ(json["enabled"], true);
    EXPECT_EQ(json["schedule"], "Every 5m");
    EXPECT_EQ(json["next_run_at_ms"], kStart + 300000);

    const auto job = service_->Get(json["id"].get<std::string>());
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(KindOf(job->payload), PayloadKind::SystemEvent);
    EXPECT_FALSE(job->delete_after_run);
}

TEST_F(CronToolTest, AddRequiresMessage) {
    EXPECT_EQ(tool_->Execute({{"action", "add"}, {"every_seconds", "60"}}), "Error: message is required");
}

TEST_F(CronToolTest, AddDefaultsNameToMessagePrefix) {
    const std::string message(60, 'x');
    const auto json = Call({{"action", "add"}, {"message", message}, {"every_ms", "1000"}});
    EXPECT_EQ(json["name"], std::string(40, 'x'));
}

TEST_F(CronToolTest, AddAgentTurnUsesContextTarget) {
    tool_->SetContext("lark", "chat-7");
    const auto json = Call({{"action", "add"}, {"message", "daily digest"}, {"kind", "cron"},
                            {"expr", "0 9 * * *"}, {"tz", "UTC"}, {"model", "small"}, {"deliver", "true"}});
    EXPECT_EQ(json["schedule"], "Cron: 0 9 * * * (UTC)");

    const auto job = service_->Get(json["id"].get<std::string>()).value();
    ASSERT_EQ(KindOf(job.payload), PayloadKind::AgentTurn);
    const auto& agent = std::get<AgentTurnPayload>(job.payload);
    EXPECT_EQ(agent.channel, "lark");
    EXPECT_EQ(agent.to, "chat-7");
    EXPECT_EQ(agent.model, "small");
    EXPECT_EQ(agent.deliver, true);
}

TEST_F(CronToolTest, AddOneShotDeletesAfterRunByDefault) {
    const auto json = Call({{"action", "add"}, {"mode", "reminder"}, {"message", "once"},
                            {"kind", "at"}, {"at_ms", std::to_string(kStart + 5000)}});
    EXPECT_EQ(json["next_run_at_ms"], kStart + 5000);
    EXPECT_TRUE(service_->Get(json["id"].get<std::string>())->delete_after_run);

    const auto kept = Call({{"action", "add"}, {"mode", "reminder"}, {"message", "once"}, {"kind", "at"},
                            {"at_ms", std::to_string(kStart + 5000)}, {"delete_after_run", "false"}});
    EXPECT_FALSE(service_->Get(kept["id"].get<std::string>())->delete_after_run);
}

TEST_F(CronToolTest, AddReportsScheduleErrors) {
    EXPECT_EQ(tool_->Execute({{"action", "add"}, {"message", "m"}}),
              "Error: every_ms or every_seconds is required for kind=every");
    EXPECT_EQ(tool_->Execute({{"action", "add"}, {"message", "m"}, {"kind", "at"}}),
              "Error: at or at_ms is required for kind=at");
    EXPECT_EQ(tool_->Execute({{"action", "add"}, {"message", "m"}, {"kind", "weekly"}}),
              "Error: invalid kind");
    EXPECT_EQ(tool_->Execute({{"action", "add"}, {"message", "m"}, {"every_seconds", "9223372036854775807"}}),
              "Error: every_seconds is too large");

    const auto output = tool_->Execute({{"action", "add"}, {"message", "m"}, {"kind", "cron"}, {"expr", "* * *"}});
    EXPECT_EQ(output, "Error: invalid cron expression: Expected 5 or 6 fields, got 3");
    EXPECT_TRUE(service_->List(true).empty());
}

// ============================================================================
// list / status / update / enable / disable / remove / run
// ============================================================================

TEST_F(CronToolTest, ListIncludesDisabledByDefault) {
    const auto id = AddReminder("a");
    AddReminder("b");
    Call({{"action", "disable"}, {"id", id}});

    const auto all = Call({{"action", "list"}});
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0]["scheduleText"], "Every 1m");

    const auto enabled = Call({{"action", "list"}, {"include_disabled", "false"}});
    ASSERT_EQ(enabled.size(), 1u);
    EXPECT_EQ(enabled[0]["name"], "b");
}

TEST_F(CronToolTest, StatusReportsCounts) {
    AddReminder("a");
    const auto json = Call({{"action", "status"}});
    EXPECT_EQ(json["started"], false);
    EXPECT_EQ(json["enabled"], false);
    EXPECT_EQ(json["jobs"], 1);
    EXPECT_EQ(json["next_wake_at_ms"], kStart + 60000);
}

TEST_F(CronToolTest, EnableAndDisable) {
    const auto id = AddReminder("a");
    auto json = Call({{"action", "disable"}, {"job_id", id}});
    EXPECT_EQ(json["enabled"], false);
    EXPECT_TRUE(json["next_run_at_ms"].is_null());

    json = Call({{"action", "enable"}, {"id", id}});
    EXPECT_EQ(json["enabled"], true);
    EXPECT_EQ(json["next_run_at_ms"], kStart + 60000);

    EXPECT_EQ(tool_->Execute({{"action", "enable"}, {"id", "missing"}}), "Error: Job not found");
}

TEST_F(CronToolTest, UpdateChangesNameScheduleAndMessage) {
    const auto id = AddReminder("a");
    const auto json = Call({{"action", "update"}, {"id", id}, {"name", "renamed"},
                            {"kind", "every"}, {"every_ms", "120000"}, {"message", "bye"}});
    EXPECT_EQ(json["name"], "renamed");
    EXPECT_EQ(json["scheduleText"], "Every 2m");
    EXPECT_EQ(json["payload"]["message"], "bye");
    EXPECT_EQ(json["payload"]["kind"], "systemEvent");
}

TEST_F(CronToolTest, UpdateRejectsAgentFieldsOnReminder) {
    const auto id = AddReminder("a");
    const auto output = tool_->Execute({{"action", "update"}, {"id", id}, {"model", "large"}});
    EXPECT_TRUE(IsError(output));
}

TEST_F(CronToolTest, UpdateSwitchesModeWithMessage) {
    const auto id = AddReminder("a");
    const auto json = Call({{"action", "update"}, {"id", id}, {"mode", "task"}, {"message", "think"}});
    EXPECT_EQ(json["payload"]["kind"], "agentTurn");
    EXPECT_EQ(json["payload"]["message"], "think");
}

TEST_F(CronToolTest, RemoveJob) {
    const auto id = AddReminder("a");
    EXPECT_EQ(tool_->Execute({{"action", "remove"}, {"id", id}}), "OK");
    EXPECT_EQ(tool_->Execute({{"action", "remove"}, {"id", id}}), "Error: job not found");
}

TEST_F(CronToolTest, RunJobNow) {
    const auto id = AddReminder("a");
    const auto json = Call({{"action", "run"}, {"id", id}});
    EXPECT_EQ(json["status"], "ok");
    EXPECT_EQ(json["summary"], "ran a");
    EXPECT_TRUE(json["error"].is_null());
    ASSERT_TRUE(last_run_.has_value());
    EXPECT_EQ(last_run_->id, id);

    EXPECT_EQ(tool_->Execute({{"action", "run"}, {"id", "missing"}}), "Error: job not found");
}

TEST_F(CronToolTest, UnforcedRunSkipsJobThatIsNotDue) {
    const auto id = AddReminder("a");
    const auto json = Call({{"action", "run"}, {"id", id}, {"force", "false"}});
    EXPECT_EQ(json["status"], "skipped");
    EXPECT_FALSE(last_run_.has_value());
}
