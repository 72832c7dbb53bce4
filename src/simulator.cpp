#include "bjsim/simulator.h"
#include "bjsim/aggregator.h"
#include "spdlog/spdlog.h"
#include <algorithm> // Pour std::sort
#include <utility>

namespace bj_sim {

Simulator::Simulator(SimulationConfig config)
    : config_(std::move(config))
{
    config_.validate();
    strategies_ = config_.resolved_strategies();
    executor_ = std::make_unique<Executor>(strategies_, config_.run_parameters(),
                                           config_.num_simulations_per_strategy,
                                           config_.seed, config_.num_workers);
    spdlog::debug("Simulator prêt : {} stratégies, {} runs chacune, {} mains max.",
                  strategies_.size(), config_.num_simulations_per_strategy, config_.max_hands);
}

Simulator::~Simulator() = default;

void Simulator::request_stop() {
    executor_->request_stop();
}

SimulationReport Simulator::run() {
    ExecutionReport execution = executor_->execute();

    Aggregator aggregator;
    std::map<std::string, size_t> order;
    SimulationReport report;
    for (size_t i = 0; i < strategies_.size(); ++i) {
        const std::string name = strategies_[i]->name();
        aggregator.expect(name, config_.num_simulations_per_strategy);
        order[name] = i;
        report.strategy_order.push_back(name);
    }
    for (const UnitFailure& f : execution.failures) {
        aggregator.add_failure(f.strategy_name);
    }

    if (config_.show_per_simulation_output) {
        report.results = execution.results;
        std::sort(report.results.begin(), report.results.end(),
                  [&order](const SimulationResult& a, const SimulationResult& b) {
                      const size_t oa = order[a.strategy_name];
                      const size_t ob = order[b.strategy_name];
                      if (oa != ob) return oa < ob;
                      return a.run_index < b.run_index;
                  });
    }
    for (SimulationResult& r : execution.results) {
        aggregator.add_result(std::move(r));
    }

    report.stats           = aggregator.stats();
    report.failures        = std::move(execution.failures);
    report.runs_requested  = execution.units_requested;
    report.runs_aggregated = static_cast<int>(aggregator.result_count());
    report.stopped         = execution.stopped;

    if (report.runs_aggregated < report.runs_requested) {
        spdlog::warn("{} runs agrégés sur {} demandés.", report.runs_aggregated, report.runs_requested);
    }
    return report;
}

SimulationReport run(const SimulationConfig& config) {
    Simulator simulator(config);
    return simulator.run();
}

} // namespace bj_sim
