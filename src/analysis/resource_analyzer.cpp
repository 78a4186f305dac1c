#include "analysis/resource_analyzer.h"
#include <algorithm>
#include <map>

namespace queueforge {

ResourceUtilization ResourceAnalyzer::analyze(const InputBundle& bundle, const Schedule& schedule,
                                              const PerformanceMetrics& metrics) {
    const auto& resources = bundle.resource_constraints;
    ResourceUtilization out;

    out.operator_utilization = std::min(90.0, 70.0 + resources.available_operators * 5.0);

    // The busiest machine is the bottleneck, once the queue is big enough to have one
    const MachineUtilization* busiest = nullptr;
    for (const auto& m : metrics.machine_utilization) {
        if (!busiest || m.utilization > busiest->utilization) busiest = &m;
    }
    const bool flag_bottleneck = schedule.size() > 3 && busiest && busiest->utilization > 0;

    double available_total = 0.0;
    int available_count = 0;
    for (size_t i = 0; i < bundle.machines.size(); ++i) {
        const Machine& machine = bundle.machines[i];
        MachineEfficiency e;
        e.machine_id = machine.id;
        e.efficiency = machine.efficiency;
        e.bottleneck = flag_bottleneck && busiest->machine_id == machine.id;
        out.machine_efficiency.push_back(std::move(e));

        if (machine.is_available() && i < metrics.machine_utilization.size()) {
            available_total += metrics.machine_utilization[i].utilization;
            ++available_count;
        }
    }

    std::map<std::string, double> demand;
    for (const auto& entry : schedule) {
        demand[entry.job.material_type] += entry.job.part_count;
    }
    for (const auto& stock : resources.material_availability) {
        MaterialUsage usage;
        usage.material_type = stock.material_type;
        double wanted = demand[stock.material_type];
        if (stock.available_quantity > 0) {
            usage.utilization = std::min(100.0, wanted / stock.available_quantity * 100.0);
        } else {
            usage.utilization = wanted > 0 ? 100.0 : 0.0;
        }
        usage.shortage = stock.available_quantity < 100 || wanted > stock.available_quantity;
        out.material_usage.push_back(std::move(usage));
    }

    const double mean_available = available_count ? available_total / available_count : 0.0;
    for (const auto& tool : resources.tooling_availability) {
        out.tooling_utilization.push_back(
            {tool.tool_type, tool.available ? mean_available : 0.0, tool.available});
    }

    for (const auto& shift : resources.operator_shifts) {
        out.shift_coverage.push_back(
            {shift.shift_id, std::min(100.0, shift.operator_count * 40.0), shift.operator_count < 2});
    }

    return out;
}

}  // namespace queueforge
