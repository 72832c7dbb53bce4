#include "bjsim/executor.h"
#include "spdlog/spdlog.h"
#include <algorithm> // Pour std::min, std::max
#include <random>    // Pour std::random_device
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace bj_sim {

namespace {

uint64_t splitmix64(uint64_t x) {
    uint64_t z = x + 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

// Signale la fin d'un producteur même si le worker sort par exception
struct ProducerGuard {
    ResultChannel& channel;
    ~ProducerGuard() { channel.producer_done(); }
};

} // namespace

// -----------------------------------------------------------------------------
//  Constructeur
// -----------------------------------------------------------------------------
Executor::Executor(std::vector<StrategyPtr> strategies, RunParameters params,
                   int runs_per_strategy, std::optional<uint64_t> base_seed, int num_workers)
    : strategies_(std::move(strategies)),
      params_(std::move(params)),
      runs_per_strategy_(runs_per_strategy),
      base_seed_(base_seed),
      num_workers_(num_workers)
{
    if (runs_per_strategy_ < 0) throw std::invalid_argument("Runs per strategy must be >= 0");
    for (const StrategyPtr& s : strategies_) {
        if (!s) throw std::invalid_argument("Null strategy given to Executor");
    }
    if (num_workers_ <= 0) {
        num_workers_ = static_cast<int>(std::thread::hardware_concurrency());
        if (num_workers_ <= 0) num_workers_ = 1;
    }
}

int Executor::total_units() const {
    return static_cast<int>(strategies_.size()) * runs_per_strategy_;
}

// -----------------------------------------------------------------------------
//  Graines
// -----------------------------------------------------------------------------
uint64_t Executor::unit_seed(uint64_t base_seed, size_t strategy_index, int run_index) {
    const uint64_t s = splitmix64(splitmix64(base_seed) ^ static_cast<uint64_t>(strategy_index));
    return splitmix64(s ^ static_cast<uint64_t>(run_index));
}

uint64_t Executor::retry_seed(uint64_t first_seed) {
    return splitmix64(first_seed ^ 0xD1B54A32D192ED03ULL);
}

void Executor::prepare_seeds() {
    const int total = total_units();
    seeds_.assign(static_cast<size_t>(total), 0);

    // random_device n'est pas garanti thread-safe : tout est tiré ici, avant les workers
    std::random_device rd;
    for (int u = 0; u < total; ++u) {
        const size_t strategy_index = static_cast<size_t>(u / runs_per_strategy_);
        const int    run_index      = u % runs_per_strategy_;
        if (base_seed_) {
            seeds_[static_cast<size_t>(u)] = unit_seed(*base_seed_, strategy_index, run_index);
        } else {
            seeds_[static_cast<size_t>(u)] = (static_cast<uint64_t>(rd()) << 32) ^ rd();
        }
    }
}

// -----------------------------------------------------------------------------
//  Exécution
// -----------------------------------------------------------------------------
ExecutionReport Executor::execute() {
    ExecutionReport report;
    const int total = total_units();
    report.units_requested = total;
    if (total == 0) return report;

    prepare_seeds();
    next_unit_.store(0);

    const int n_threads = std::max(1, std::min(num_workers_, total));
    spdlog::info("Lancement de {} simulations ({} stratégies x {}) sur {} threads.",
                 total, strategies_.size(), runs_per_strategy_, n_threads);

    ResultChannel channel(n_threads);
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(n_threads));
    try {
        for (int th = 0; th < n_threads; ++th) {
            threads.emplace_back([this, &channel]() { worker_loop(channel); });
        }
    } catch (const std::system_error& e) {
        // Les workers déjà lancés s'arrêtent, les autres ne seront jamais attendus
        spdlog::error("Lancement du thread {} / {} impossible : {}", threads.size() + 1, n_threads, e.what());
        request_stop();
        channel.release_producers(n_threads - static_cast<int>(threads.size()));
        while (channel.pop()) {}
        for (auto& t : threads) t.join();
        throw;
    }

    // Le thread appelant est l'unique consommateur
    while (std::optional<UnitMessage> message = channel.pop()) {
        if (message->result) {
            report.results.push_back(std::move(*message->result));
        } else {
            const std::string& name = strategies_[message->unit.strategy_index]->name();
            spdlog::warn("[{}] Run {} exclu après {} tentatives : {}",
                         name, message->unit.run_index, message->attempts, message->error);
            report.failures.push_back({name, message->unit.run_index, message->error});
        }
    }

    for (auto& t : threads) t.join();

    report.stopped = stop_.load();
    spdlog::info("{} / {} simulations terminées ({} exclues{}).",
                 report.results.size(), total, report.failures.size(),
                 report.stopped ? ", arrêt demandé" : "");
    return report;
}

void Executor::request_stop() {
    stop_.store(true);
}

void Executor::worker_loop(ResultChannel& channel) {
    ProducerGuard guard{channel};
    const int total = total_units();
    int u;
    while (!stop_.load(std::memory_order_relaxed)
           && (u = next_unit_.fetch_add(1, std::memory_order_relaxed)) < total) {
        const WorkUnit unit{static_cast<size_t>(u / runs_per_strategy_), u % runs_per_strategy_};
        if (std::optional<UnitMessage> message = run_unit(unit)) {
            channel.push(std::move(*message));
        }
    }
}

std::optional<UnitMessage> Executor::run_unit(const WorkUnit& unit) {
    const Strategy& strategy = *strategies_[unit.strategy_index];
    const size_t unit_index = unit.strategy_index * static_cast<size_t>(runs_per_strategy_)
                            + static_cast<size_t>(unit.run_index);

    UnitMessage message;
    message.unit = unit;
    uint64_t seed = seeds_[unit_index];

    for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt) {
        message.attempts = attempt;
        try {
            SimulationRunner runner(strategy, params_, seed, unit.run_index);
            std::optional<SimulationResult> result = runner.run(&stop_);
            if (!result) return std::nullopt; // interrompu : jamais agrégé
            message.result = std::move(result);
            message.error.clear();
            return message;
        } catch (const std::exception& e) {
            message.error = e.what();
            spdlog::error("Unité ({}, run {}) : échec tentative {}/{} : {}",
                          unit.strategy_index, unit.run_index, attempt, MAX_ATTEMPTS, e.what());
            seed = retry_seed(seed);
        }
    }
    return message;
}

} // namespace bj_sim
