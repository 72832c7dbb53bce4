#ifndef BJSIM_SIMULATOR_H
#define BJSIM_SIMULATOR_H

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "bjsim/executor.h"
#include "bjsim/simulation_config.h"
#include "bjsim/simulation_result.h"

namespace bj_sim {

struct SimulationReport {
    std::map<std::string, AggregateStats> stats;
    std::vector<std::string>      strategy_order;  // ordre de la configuration
    std::vector<SimulationResult> results;         // vide sauf si show_per_simulation_output
    std::vector<UnitFailure>      failures;
    int  runs_requested  = 0;
    int  runs_aggregated = 0;
    bool stopped         = false;
};

// Point d'entrée du moteur : configuration -> statistiques par stratégie.
class Simulator {
public:
    // Lève ConfigurationError si la configuration est invalide.
    explicit Simulator(SimulationConfig config);
    ~Simulator();

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    SimulationReport run();

    // Thread-safe ; les runs interrompus ne sont pas agrégés.
    void request_stop();

    const SimulationConfig& config() const { return config_; }

private:
    SimulationConfig          config_;
    std::vector<StrategyPtr>  strategies_;
    std::unique_ptr<Executor> executor_;
};

// Raccourci : valide, exécute, agrège.
SimulationReport run(const SimulationConfig& config);

} // namespace bj_sim

#endif // BJSIM_SIMULATOR_H
