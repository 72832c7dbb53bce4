#include "bjsim/counting_strategies.h"
#include "bjsim/errors.h"
#include "bjsim/report.h"
#include "bjsim/simulation_config.h"
#include "bjsim/simulator.h"
#include "spdlog/spdlog.h"

#include <atomic>     // std::atomic
#include <csignal>    // std::signal
#include <exception>  // std::exception
#include <fstream>    // std::ofstream
#include <iostream>   // std::cout, std::cerr
#include <optional>   // std::optional
#include <string>     // std::string

namespace {

std::atomic<bj_sim::Simulator*> g_simulator{nullptr};

extern "C" void on_interrupt(int /*signal*/) {
    if (bj_sim::Simulator* sim = g_simulator.load()) sim->request_stop();
}

} // namespace

int main(int /*argc*/, char* /*argv*/[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Démarrage du simulateur de blackjack…");

    // ─────────────────────────────────────────────────────────────
    // Paramètres généraux
    // ─────────────────────────────────────────────────────────────
    const double                     player_balance  = 1000.0;
    const int                        num_decks       = 6;
    const int                        simulations     = 200;
    const int                        max_hands       = 500;
    const double                     min_bet         = 5.0;
    const double                     bet_margin      = 2.0;
    const bool                       allow_surrender = true;
    const bool                       per_simulation  = false;
    const std::optional<std::string> output_file;     // nullopt : sortie standard

    try
    {
        // 1. Configuration
        bj_sim::SimulationConfig config;
        config.player_balance               = player_balance;
        config.num_decks                    = num_decks;
        config.num_simulations_per_strategy = simulations;
        config.max_hands                    = max_hands;
        config.min_bet                      = min_bet;
        config.bet_margin                   = bet_margin;
        config.allow_surrender              = allow_surrender;
        config.show_per_simulation_output   = per_simulation;
        config.output_file                  = output_file;
        config.strategies                   = bj_sim::builtin_strategies();

        // 2. Valider et préparer
        bj_sim::Simulator simulator(config);
        spdlog::info("{} stratégies, {} simulations chacune, {} mains max.",
                     config.strategies.size(), simulations, max_hands);

        g_simulator = &simulator;
        std::signal(SIGINT, on_interrupt);

        // 3. Exécuter
        const bj_sim::SimulationReport report = simulator.run();
        g_simulator = nullptr;
        std::signal(SIGINT, SIG_DFL);

        // 4. Écrire le rapport
        if (config.output_file)
        {
            std::ofstream out(*config.output_file);
            if (!out)
            {
                spdlog::error("Impossible d'ouvrir {}.", *config.output_file);
                return 1;
            }
            bj_sim::write_report(out, report, config.show_per_simulation_output);
            spdlog::info("Rapport écrit dans {}.", *config.output_file);
        }
        else
        {
            bj_sim::write_report(std::cout, report, config.show_per_simulation_output);
        }

        if (report.stopped)
            spdlog::warn("Arrêt demandé : {} runs sur {} agrégés.",
                         report.runs_aggregated, report.runs_requested);
    }
    catch (const bj_sim::ConfigurationError& e)
    {
        spdlog::critical("Configuration invalide : {}", e.what());
        std::cerr << "Configuration invalide : " << e.what() << '\n';
        return 2;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
