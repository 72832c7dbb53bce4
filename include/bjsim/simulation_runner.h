#ifndef BJSIM_SIMULATION_RUNNER_H
#define BJSIM_SIMULATION_RUNNER_H

#include <atomic>
#include <cstdint>
#include <optional>
#include "core/shoe.hpp"
#include "bjsim/common_types.h"
#include "bjsim/count_tracker.h"
#include "bjsim/simulation_result.h"
#include "bjsim/strategy.h"
#include "bjsim/table.h"

namespace bj_sim {

// Paramètres d'une simulation, copiés depuis la configuration.
struct RunParameters {
    TableRules rules;
    double     table_balance  = 0.0;
    double     player_balance = 0.0;
    int        max_hands      = 0;
};

// Enchaîne les mains d'un tuple (stratégie, sabot, table, compte) jusqu'à
// une condition terminale. Tout l'état mutable appartient au runner.
// Déterministe pour une graine donnée.
class SimulationRunner {
public:
    SimulationRunner(const Strategy& strategy, const RunParameters& params,
                     uint64_t seed, int run_index = 0);

    // Joue jusqu'à la fin. std::nullopt si stop_flag passe à vrai entre deux
    // mains (simulation abandonnée, jamais agrégée).
    // ShoeExhausted ne sort d'ici que sur une erreur de logique du remélange.
    std::optional<SimulationResult> run(const std::atomic<bool>* stop_flag = nullptr);

    // Valeur dure qu'une main complète (splits et croupier compris) peut consommer
    // au plus. Un sabot dont les cartes restantes valent au moins autant ne peut
    // pas être vidé en cours de main, même à une pénétration de 1.0.
    static int round_value_reserve(const TableRules& rules);

    // Accès pour les tests : à utiliser avant run()
    Shoe& shoe() { return shoe_; }
    const CountTracker& tracker() const { return tracker_; }
    const PlayerAccount& account() const { return account_; }
    const Table& table() const { return table_; }

private:
    // Remélange au passage de la carte de coupe, ou quand la réserve n'est plus
    // garantie ; remet le compte à zéro.
    void reshuffle_if_needed();

    const Strategy& strategy_;
    RunParameters   params_;
    uint64_t        seed_;
    int             run_index_;

    Shoe          shoe_;
    CountTracker  tracker_;
    Table         table_;
    PlayerAccount account_;
};

} // namespace bj_sim

#endif // BJSIM_SIMULATION_RUNNER_H
