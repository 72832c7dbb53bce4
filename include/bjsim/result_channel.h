#ifndef BJSIM_RESULT_CHANNEL_H
#define BJSIM_RESULT_CHANNEL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "bjsim/simulation_result.h"

namespace bj_sim {

// Unité de travail : un run d'une stratégie
struct WorkUnit {
    size_t strategy_index = 0;
    int    run_index      = 0;
};

// Message d'un worker vers le consommateur : un résultat, ou l'échec
// définitif de l'unité (après la seconde tentative).
struct UnitMessage {
    WorkUnit                        unit;
    std::optional<SimulationResult> result;
    std::string                     error;
    int                             attempts = 0;
};

// File multi-producteurs / mono-consommateur.
// Fermée automatiquement quand le dernier producteur appelle producer_done().
class ResultChannel {
public:
    explicit ResultChannel(int num_producers);

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    void push(UnitMessage message);

    // Bloque jusqu'au prochain message. std::nullopt une fois fermée et vide.
    std::optional<UnitMessage> pop();

    void producer_done();

    // Producteurs prévus mais jamais lancés : le canal ne les attend plus.
    void release_producers(int count);

    bool is_closed() const;
    size_t pushed_count() const;

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<UnitMessage> queue_;
    int                     producers_left_;
    size_t                  pushed_ = 0;
};

} // namespace bj_sim

#endif // BJSIM_RESULT_CHANNEL_H
