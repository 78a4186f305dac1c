#pragma once
#ifndef QUEUEFORGE_TEST_FIXTURES_H
#define QUEUEFORGE_TEST_FIXTURES_H

#include <string>
#include <vector>
#include "model/types.h"

namespace queueforge::fixtures {

// Monday 2024-06-03 08:00 UTC
inline TimePoint reference_now() {
    TimePoint tp;
    parse_iso_time("2024-06-03T08:00:00Z", tp);
    return tp;
}

inline TimePoint hours_after(TimePoint base, double hours) {
    return base + to_clock_duration(hours * 60.0);
}

inline Job make_job(const std::string& id, PriorityTier priority = PriorityTier::Normal,
                    double due_in_hours = 200.0, double duration = 60.0, double setup = 10.0) {
    Job job;
    job.id = id;
    job.name = "Job " + id;
    job.priority = priority;
    job.due_date = hours_after(reference_now(), due_in_hours);
    job.estimated_duration = duration;
    job.material_type = "steel";
    job.thickness = 5.0;
    job.setup_time = setup;
    job.part_count = 10;
    return job;
}

inline Machine make_machine(const std::string& id, double multiplier = 1.0) {
    Machine m;
    m.id = id;
    m.name = "Laser " + id;
    m.max_power = 4000;
    m.material_compatibility = {"steel", "aluminum"};
    m.thickness_range = {0.5, 20.0};
    m.status = MachineStatus::Available;
    m.efficiency = 90;
    m.setup_time_multiplier = multiplier;
    m.operator_skill = SkillLevel::Advanced;
    return m;
}

inline InputBundle make_bundle(std::vector<Job> jobs, std::vector<Machine> machines) {
    InputBundle bundle;
    bundle.job_queue = std::move(jobs);
    bundle.machines = std::move(machines);
    bundle.resource_constraints.available_operators = 4;
    return bundle;
}

}  // namespace queueforge::fixtures

#endif  // QUEUEFORGE_TEST_FIXTURES_H
