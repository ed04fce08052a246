/**
 * @file test_run_history.cpp
 * @brief Unit tests for the bounded run history.
 */

#include "history/run_history.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>

using namespace jobguard;

namespace {

RunRecord make_record(RunId id, const JobName& job, RunOutcome outcome = RunOutcome::Success,
                      Timestamp finished = std::chrono::system_clock::now()) {
    RunRecord r;
    r.run_id = id;
    r.job_name = job;
    r.started_at = finished - std::chrono::milliseconds{250};
    r.finished_at = finished;
    r.outcome = outcome;
    return r;
}

}  // namespace

TEST(RunHistoryTest, AppendAndQuery) {
    RunHistory history;
    history.append(make_record(1, "sync"));
    history.append(make_record(2, "index"));
    history.append(make_record(3, "sync", RunOutcome::Failed));

    EXPECT_EQ(history.size(), 3u);
    auto sync = history.records_for("sync");
    ASSERT_EQ(sync.size(), 2u);
    EXPECT_EQ(sync[0].run_id, 1u);
    EXPECT_EQ(sync[1].run_id, 3u);

    auto last = history.last("sync");
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->outcome, RunOutcome::Failed);
    EXPECT_FALSE(history.last("unknown").has_value());
}

TEST(RunHistoryTest, RecordsForOrdersByRunIdNotFinishOrder) {
    RunHistory history;
    // A long run admitted first finishes after a later one.
    history.append(make_record(7, "sync"));
    history.append(make_record(5, "sync"));

    auto sync = history.records_for("sync");
    ASSERT_EQ(sync.size(), 2u);
    EXPECT_EQ(sync[0].run_id, 5u);
    EXPECT_EQ(history.last("sync")->run_id, 7u);
    EXPECT_EQ(history.records().front().run_id, 7u);
}

TEST(RunHistoryTest, CountRetention) {
    RunHistory history(HistoryOptions{.retention_count = 3, .retention_age = std::chrono::hours{0}});
    for (RunId id = 1; id <= 5; ++id) history.append(make_record(id, "sync"));

    EXPECT_EQ(history.size(), 3u);
    EXPECT_EQ(history.records().front().run_id, 3u);
}

TEST(RunHistoryTest, AgeRetention) {
    RunHistory history(HistoryOptions{.retention_count = 0, .retention_age = std::chrono::hours{1}});
    auto now = std::chrono::system_clock::now();

    history.append(make_record(1, "sync", RunOutcome::Success, now - std::chrono::hours{2}));
    EXPECT_EQ(history.size(), 0u);

    history.append(make_record(2, "sync", RunOutcome::Success, now));
    history.append(make_record(3, "sync", RunOutcome::Success, now));
    EXPECT_EQ(history.size(), 2u);

    EXPECT_EQ(history.prune(now + std::chrono::hours{2}), 2u);
    EXPECT_EQ(history.size(), 0u);
}

TEST(RunHistoryTest, UnboundedKeepsEverything) {
    RunHistory history(HistoryOptions{.retention_count = 0, .retention_age = std::chrono::hours{0}});
    for (RunId id = 1; id <= 600; ++id) history.append(make_record(id, "sync"));
    EXPECT_EQ(history.size(), 600u);
}

TEST(RunHistoryTest, ConcurrentAppends) {
    RunHistory history(HistoryOptions{.retention_count = 0, .retention_age = std::chrono::hours{0}});
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&history, t] {
            for (int i = 0; i < 100; ++i) {
                history.append(make_record(static_cast<RunId>(t * 100 + i + 1), "job" + std::to_string(t)));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(history.size(), 400u);
    EXPECT_EQ(history.records_for("job2").size(), 100u);
}

TEST(RunRecordJsonTest, Fields) {
    auto r = make_record(42, "plugin \"sync\"", RunOutcome::TimedOut);
    r.reason = ReasonCode::Timeout;
    r.error_summary = "exceeded timeout of 5.000s";
    r.worker_pid = 1234;
    r.term_signal = 15;

    auto json = to_json(r);
    EXPECT_NE(json.find(R"("run_id":42)"), std::string::npos);
    EXPECT_NE(json.find(R"("job":"plugin \"sync\"")"), std::string::npos);
    EXPECT_NE(json.find(R"("duration_ms":250)"), std::string::npos);
    EXPECT_NE(json.find(R"("attempt":0)"), std::string::npos);
    EXPECT_NE(json.find(R"("outcome":"timed_out")"), std::string::npos);
    EXPECT_NE(json.find(R"("reason":"timeout")"), std::string::npos);
    EXPECT_NE(json.find(R"("error":"exceeded timeout of 5.000s")"), std::string::npos);
    EXPECT_NE(json.find(R"("pid":1234)"), std::string::npos);
    EXPECT_NE(json.find(R"("signal":15)"), std::string::npos);
    EXPECT_EQ(json.find("exit_code"), std::string::npos);
}

TEST(RunHistoryTest, SinkReceivesEveryRecord) {
    auto dir = std::filesystem::temp_directory_path() / "jg_test_history";
    std::filesystem::remove_all(dir);
    {
        RunHistory history(HistoryOptions{.retention_count = 1, .retention_age = std::chrono::hours{0}},
                           std::make_unique<JsonFileSink>(dir, "runs"));
        history.append(make_record(1, "sync"));
        history.append(make_record(2, "sync"));
        EXPECT_EQ(history.size(), 1u);
    }

    std::ifstream in(dir / "runs.ndjson");
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(R"("run_id":1)"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("run_id":2)"), std::string::npos);

    std::filesystem::remove_all(dir);
}
