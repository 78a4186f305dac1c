#include <gtest/gtest.h>
#include "fixtures.h"
#include "scheduling/schedule_builder.h"
#include <algorithm>
#include <stdexcept>

using namespace queueforge;
using namespace queueforge::fixtures;

namespace {

const ScheduledJob& entry_for(const Schedule& schedule, const std::string& id) {
    auto it = std::find_if(schedule.begin(), schedule.end(),
                           [&id](const ScheduledJob& s) { return s.job.id == id; });
    if (it == schedule.end()) throw std::out_of_range("no scheduled job " + id);
    return *it;
}

}  // namespace

TEST(ScheduleBuilderTest, test_sequence_numbers_are_permutation) {
    std::vector<Job> jobs;
    for (int i = 0; i < 7; ++i) {
        jobs.push_back(make_job("J" + std::to_string(i),
                                static_cast<PriorityTier>(i % 5), 10.0 + i * 30.0));
    }
    std::vector<Machine> machines = {make_machine("M1"), make_machine("M2")};

    Schedule schedule = ScheduleBuilder().build(jobs, machines, {}, reference_now());
    ASSERT_EQ(schedule.size(), jobs.size());
    std::vector<int> seq;
    for (const auto& s : schedule) seq.push_back(s.sequence_number);
    std::sort(seq.begin(), seq.end());
    for (int i = 0; i < 7; ++i) EXPECT_EQ(seq[i], i + 1);
}

TEST(ScheduleBuilderTest, test_duration_equals_setup_plus_processing) {
    std::vector<Job> jobs = {make_job("J1", PriorityTier::High, 50, 45, 12),
                             make_job("J2", PriorityTier::Low, 90, 120, 0)};
    std::vector<Machine> machines = {make_machine("M1", 1.5)};

    for (const auto& s : ScheduleBuilder().build(jobs, machines, {}, reference_now())) {
        EXPECT_NEAR(minutes_between(s.scheduled_start, s.scheduled_end),
                    s.effective_setup_time + s.job.estimated_duration, 1e-6);
        EXPECT_DOUBLE_EQ(s.effective_setup_time, s.job.setup_time * 1.5);
    }
}

TEST(ScheduleBuilderTest, test_equal_scores_keep_queue_order) {
    std::vector<Job> jobs = {make_job("A"), make_job("B"), make_job("C")};
    std::vector<Machine> machines = {make_machine("M1")};

    Schedule schedule = ScheduleBuilder().build(jobs, machines, {}, reference_now());
    ASSERT_EQ(schedule.size(), 3u);
    EXPECT_EQ(schedule[0].job.id, "A");
    EXPECT_EQ(schedule[1].job.id, "B");
    EXPECT_EQ(schedule[2].job.id, "C");
}

TEST(ScheduleBuilderTest, test_critical_job_goes_first) {
    TimePoint now = reference_now();
    std::vector<Job> jobs = {make_job("LOW", PriorityTier::Low, 30 * 24),
                             make_job("CRIT", PriorityTier::Critical, 24)};
    std::vector<Machine> machines = {make_machine("M1")};

    Schedule schedule = ScheduleBuilder().build(jobs, machines, {}, now);
    const auto& crit = entry_for(schedule, "CRIT");
    const auto& low = entry_for(schedule, "LOW");
    EXPECT_EQ(crit.sequence_number, 1);
    EXPECT_EQ(low.sequence_number, 2);
    EXPECT_LT(crit.scheduled_start, low.scheduled_start);
    EXPECT_EQ(crit.scheduled_start, now);
}

TEST(ScheduleBuilderTest, test_back_to_back_jobs_keep_buffer) {
    std::vector<Job> jobs = {make_job("A", PriorityTier::Normal, 200, 60, 10),
                             make_job("B", PriorityTier::Normal, 200, 60, 10)};
    std::vector<Machine> machines = {make_machine("M1", 1.0)};

    Schedule schedule = ScheduleBuilder().build(jobs, machines, {}, reference_now());
    ASSERT_EQ(schedule.size(), 2u);
    EXPECT_DOUBLE_EQ(schedule[0].buffer_time, 6.0);
    EXPECT_GE(minutes_between(schedule[0].scheduled_end, schedule[1].scheduled_start), 6.0 - 1e-6);
}

TEST(ScheduleBuilderTest, test_buffer_has_minimum) {
    ScheduleBuilder builder;
    EXPECT_DOUBLE_EQ(builder.buffer_for(make_job("S", PriorityTier::Normal, 200, 20)), 5.0);
    EXPECT_DOUBLE_EQ(builder.buffer_for(make_job("L", PriorityTier::Normal, 200, 300)), 30.0);

    BuildOptions options;
    options.min_buffer_minutes = 0.0;
    options.buffer_ratio = 0.0;
    EXPECT_DOUBLE_EQ(ScheduleBuilder(options).buffer_for(make_job("Z")), 0.0);
}

TEST(ScheduleBuilderTest, test_parallel_machines_start_together) {
    TimePoint now = reference_now();
    std::vector<Job> jobs = {make_job("A"), make_job("B")};
    std::vector<Machine> machines = {make_machine("M1"), make_machine("M2")};

    Schedule schedule = ScheduleBuilder().build(jobs, machines, {}, now);
    EXPECT_EQ(schedule[0].assigned_machine, "M1");
    EXPECT_EQ(schedule[1].assigned_machine, "M2");
    EXPECT_EQ(schedule[0].scheduled_start, now);
    EXPECT_EQ(schedule[1].scheduled_start, now);
}

TEST(ScheduleBuilderTest, test_third_job_takes_earliest_free_machine) {
    TimePoint now = reference_now();
    std::vector<Job> jobs = {make_job("LONG", PriorityTier::Critical, 200, 300, 0),
                             make_job("SHORT", PriorityTier::High, 200, 30, 0),
                             make_job("NEXT", PriorityTier::Low, 200, 30, 0)};
    std::vector<Machine> machines = {make_machine("M1"), make_machine("M2")};

    Schedule schedule = ScheduleBuilder().build(jobs, machines, {}, now);
    const auto& next = entry_for(schedule, "NEXT");
    EXPECT_EQ(next.assigned_machine, "M2");
    // SHORT ends at 30, plus the 5 minute minimum buffer
    EXPECT_NEAR(minutes_between(now, next.scheduled_start), 35.0, 1e-6);
}

TEST(ScheduleBuilderTest, test_dependency_runs_first) {
    TimePoint now = reference_now();
    Job base = make_job("BASE", PriorityTier::Low, 300);
    Job follow = make_job("FOLLOW", PriorityTier::Critical, 10);
    follow.dependencies = {"BASE"};
    std::vector<Machine> machines = {make_machine("M1"), make_machine("M2")};

    Schedule schedule = ScheduleBuilder().build({follow, base}, machines, {}, now);
    const auto& b = entry_for(schedule, "BASE");
    const auto& f = entry_for(schedule, "FOLLOW");
    EXPECT_EQ(b.sequence_number, 1);
    EXPECT_EQ(f.sequence_number, 2);
    // M2 is idle, but the successor still waits for its predecessor
    EXPECT_EQ(f.assigned_machine, "M2");
    EXPECT_EQ(f.scheduled_start, b.scheduled_end);
}

TEST(ScheduleBuilderTest, test_unknown_dependency_ignored) {
    Job job = make_job("J1");
    job.dependencies = {"GHOST"};
    std::vector<Machine> machines = {make_machine("M1")};

    Schedule schedule = ScheduleBuilder().build({job}, machines, {}, reference_now());
    ASSERT_EQ(schedule.size(), 1u);
    EXPECT_EQ(schedule[0].scheduled_start, reference_now());
}

TEST(ScheduleBuilderTest, test_dependency_cycle_throws) {
    Job a = make_job("A");
    Job b = make_job("B");
    a.dependencies = {"B"};
    b.dependencies = {"A"};
    std::vector<Machine> machines = {make_machine("M1")};
    EXPECT_THROW(ScheduleBuilder().build({a, b}, machines, {}, reference_now()),
                 std::invalid_argument);
}

TEST(ScheduleBuilderTest, test_dependencies_ignored_when_not_enforced) {
    TimePoint now = reference_now();
    Job base = make_job("BASE", PriorityTier::Low, 300);
    Job follow = make_job("FOLLOW", PriorityTier::Critical, 10);
    follow.dependencies = {"BASE"};
    std::vector<Machine> machines = {make_machine("M1"), make_machine("M2")};

    BuildOptions options;
    options.enforce_dependencies = false;
    Schedule schedule = ScheduleBuilder(options).build({base, follow}, machines, {}, now);
    EXPECT_EQ(schedule[0].job.id, "FOLLOW");
    EXPECT_EQ(schedule[0].scheduled_start, now);
    EXPECT_EQ(schedule[1].scheduled_start, now);
}

TEST(ScheduleBuilderTest, test_unmatched_job_flagged) {
    TimePoint now = reference_now();
    Job odd = make_job("ODD", PriorityTier::Critical, 10, 60, 10);
    odd.material_type = "titanium";
    std::vector<Machine> machines = {make_machine("M1", 2.0)};

    Schedule schedule = ScheduleBuilder().build({odd, make_job("OK")}, machines, {}, now);
    const auto& flagged = entry_for(schedule, "ODD");
    EXPECT_TRUE(flagged.unassignable);
    EXPECT_TRUE(flagged.assigned_machine.empty());
    EXPECT_DOUBLE_EQ(flagged.effective_setup_time, 10.0);

    // The holding lane does not consume machine time
    const auto& ok = entry_for(schedule, "OK");
    EXPECT_FALSE(ok.unassignable);
    EXPECT_EQ(ok.assigned_machine, "M1");
    EXPECT_EQ(ok.scheduled_start, now);
}

TEST(ScheduleBuilderTest, test_successor_of_unassignable_job_does_not_wait) {
    TimePoint now = reference_now();
    Job odd = make_job("ODD", PriorityTier::Critical, 10, 600, 0);
    odd.material_type = "titanium";
    Job next = make_job("NEXT", PriorityTier::Normal, 200, 60, 0);
    next.dependencies = {"ODD"};
    std::vector<Machine> machines = {make_machine("M1")};

    Schedule schedule = ScheduleBuilder().build({odd, next}, machines, {}, now);
    EXPECT_TRUE(entry_for(schedule, "ODD").unassignable);
    const auto& n = entry_for(schedule, "NEXT");
    EXPECT_EQ(n.sequence_number, 2);
    EXPECT_EQ(n.scheduled_start, now);
}

TEST(ScheduleBuilderTest, test_unmatched_job_falls_back_to_first_machine) {
    Job odd = make_job("ODD", PriorityTier::Normal, 200, 60, 10);
    odd.thickness = 50.0;
    std::vector<Machine> machines = {make_machine("M1", 2.0), make_machine("M2")};

    BuildOptions options;
    options.unmatched_policy = UnmatchedPolicy::Fallback;
    Schedule schedule = ScheduleBuilder(options).build({odd}, machines, {}, reference_now());
    ASSERT_EQ(schedule.size(), 1u);
    EXPECT_FALSE(schedule[0].unassignable);
    EXPECT_EQ(schedule[0].assigned_machine, "M1");
    EXPECT_DOUBLE_EQ(schedule[0].effective_setup_time, 20.0);
}

TEST(ScheduleBuilderTest, test_earliest_completion_prefers_faster_setup) {
    Job job = make_job("J1", PriorityTier::Normal, 200, 60, 30);
    std::vector<Machine> machines = {make_machine("SLOW", 3.0), make_machine("FAST", 1.0)};

    Schedule available = ScheduleBuilder().build({job}, machines, {}, reference_now());
    EXPECT_EQ(available[0].assigned_machine, "SLOW");

    BuildOptions options;
    options.selection = MachineSelection::EarliestCompletion;
    Schedule completion = ScheduleBuilder(options).build({job}, machines, {}, reference_now());
    EXPECT_EQ(completion[0].assigned_machine, "FAST");
    EXPECT_DOUBLE_EQ(completion[0].effective_setup_time, 30.0);
}

TEST(ScheduleBuilderTest, test_empty_machine_list_throws) {
    EXPECT_THROW(ScheduleBuilder().build({make_job("J1")}, {}, {}, reference_now()),
                 std::invalid_argument);
}

TEST(ScheduleBuilderTest, test_sequence_matches_build_order) {
    std::vector<Job> jobs = {make_job("A", PriorityTier::Low), make_job("B", PriorityTier::Urgent),
                             make_job("C", PriorityTier::High)};
    ScheduleBuilder builder;
    auto order = builder.sequence(jobs, {}, reference_now());
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1u);
    EXPECT_EQ(order[1], 2u);
    EXPECT_EQ(order[2], 0u);
}
