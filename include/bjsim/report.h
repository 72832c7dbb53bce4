#ifndef BJSIM_REPORT_H
#define BJSIM_REPORT_H

#include <ostream>
#include <string>
#include "bjsim/simulation_result.h"
#include "bjsim/simulator.h"

namespace bj_sim {

// Un bloc par stratégie (ordre de la configuration), puis une ligne par run si per_run.
void write_report(std::ostream& out, const SimulationReport& report, bool per_run);

std::string format_stats(const AggregateStats& stats);
std::string format_result(const SimulationResult& result);

} // namespace bj_sim

#endif // BJSIM_REPORT_H
