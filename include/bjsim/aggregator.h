#ifndef BJSIM_AGGREGATOR_H
#define BJSIM_AGGREGATOR_H

#include <map>
#include <string>
#include <vector>
#include "bjsim/simulation_result.h"

namespace bj_sim {

// Regroupe les SimulationResult par stratégie et calcule les AggregateStats.
// Le résultat ne dépend pas de l'ordre d'arrivée : chaque groupe est trié
// par run_index avant la réduction.
class Aggregator {
public:
    Aggregator() = default;

    // Nombre de runs demandés pour une stratégie (une stratégie attendue
    // apparaît dans stats() même sans aucun résultat).
    void expect(const std::string& strategy_name, int runs_requested);

    void add_result(SimulationResult result);
    void add_failure(const std::string& strategy_name);

    size_t result_count() const;

    std::map<std::string, AggregateStats> stats() const;

    // Réduction d'un groupe de résultats d'une même stratégie
    static AggregateStats reduce(const std::string& strategy_name,
                                 std::vector<SimulationResult> results,
                                 int runs_requested, int runs_failed);

private:
    std::map<std::string, std::vector<SimulationResult>> results_;
    std::map<std::string, int> requested_;
    std::map<std::string, int> failed_;
};

} // namespace bj_sim

#endif // BJSIM_AGGREGATOR_H
