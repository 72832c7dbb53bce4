#ifndef BJSIM_EXECUTOR_H
#define BJSIM_EXECUTOR_H

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "bjsim/result_channel.h"
#include "bjsim/simulation_result.h"
#include "bjsim/simulation_runner.h"
#include "bjsim/strategy.h"

namespace bj_sim {

// Unité exclue après deux échecs
struct UnitFailure {
    std::string strategy_name;
    int         run_index = 0;
    std::string reason;
};

struct ExecutionReport {
    std::vector<SimulationResult> results;   // ordre d'arrivée
    std::vector<UnitFailure>      failures;
    int                           units_requested = 0;
    bool                          stopped         = false;
};

// Répartit |stratégies| x N runs sur un pool de threads.
// Chaque unité construit son propre SimulationRunner (sabot, compte, compteur, RNG) ;
// seules les stratégies et les paramètres sont partagés, en lecture seule.
// Le seul point de synchronisation est le ResultChannel.
class Executor {
public:
    static constexpr int MAX_ATTEMPTS = 2;

    Executor(std::vector<StrategyPtr> strategies, RunParameters params,
             int runs_per_strategy, std::optional<uint64_t> base_seed = std::nullopt,
             int num_workers = 0);

    // Bloquant : lance les workers, consomme le canal, attend la fin.
    ExecutionReport execute();

    // Peut être appelé depuis n'importe quel thread.
    // Les unités non commencées sont abandonnées, les runs en cours s'arrêtent
    // entre deux mains sans produire de résultat.
    void request_stop();
    bool stop_requested() const { return stop_.load(); }

    int worker_count() const { return num_workers_; }
    int total_units() const;

    // Graine d'une unité pour une graine de base donnée (splitmix64).
    static uint64_t unit_seed(uint64_t base_seed, size_t strategy_index, int run_index);
    // Graine de la seconde tentative
    static uint64_t retry_seed(uint64_t first_seed);

private:
    void worker_loop(ResultChannel& channel);
    std::optional<UnitMessage> run_unit(const WorkUnit& unit);
    void prepare_seeds();

    std::vector<StrategyPtr> strategies_;
    RunParameters            params_;
    int                      runs_per_strategy_;
    std::optional<uint64_t>  base_seed_;
    int                      num_workers_;
    std::vector<uint64_t>    seeds_; // première graine de chaque unité, tirée avant le lancement

    std::atomic<int>  next_unit_{0};
    std::atomic<bool> stop_{false};
};

} // namespace bj_sim

#endif // BJSIM_EXECUTOR_H
