#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <utility>
#include "bjsim/counting_strategies.h"
#include "bjsim/executor.h"
#include "bjsim/result_channel.h"
#include "test_strategies.hpp"

using namespace bj_sim;
using bj_sim::testing::FlakyStrategy;
using bj_sim::testing::SplitHitterStrategy;

namespace {

RunParameters small_params() {
    RunParameters p;
    p.rules.num_decks = 1;
    p.table_balance   = std::numeric_limits<double>::infinity();
    p.player_balance  = 300.0;
    p.max_hands       = 40;
    return p;
}

std::vector<SimulationResult> sorted(std::vector<SimulationResult> results) {
    std::sort(results.begin(), results.end(), [](const SimulationResult& a, const SimulationResult& b) {
        if (a.strategy_name != b.strategy_name) return a.strategy_name < b.strategy_name;
        return a.run_index < b.run_index;
    });
    return results;
}

} // namespace

TEST_CASE("Result channel delivers every message once", "[executor][channel]") {
    ResultChannel channel(2);
    UnitMessage m;
    m.unit.run_index = 1;
    channel.push(m);
    m.unit.run_index = 2;
    channel.push(m);
    channel.producer_done();
    REQUIRE_FALSE(channel.is_closed());
    channel.producer_done();
    REQUIRE(channel.is_closed());

    auto first = channel.pop();
    auto second = channel.pop();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->unit.run_index == 1);
    REQUIRE(second->unit.run_index == 2);
    REQUIRE_FALSE(channel.pop().has_value());
    REQUIRE(channel.pushed_count() == 2);
    REQUIRE_THROWS_AS(channel.push(m), std::logic_error);
}

TEST_CASE("Result channel closes when unstarted producers are released", "[executor][channel]") {
    ResultChannel channel(4);
    UnitMessage m;
    m.unit.run_index = 3;
    channel.push(m);

    // Un seul worker a démarré sur les quatre prévus
    channel.release_producers(3);
    REQUIRE_FALSE(channel.is_closed());
    channel.producer_done();
    REQUIRE(channel.is_closed());

    auto message = channel.pop();
    REQUIRE(message.has_value());
    REQUIRE(message->unit.run_index == 3);
    REQUIRE_FALSE(channel.pop().has_value());

    REQUIRE_THROWS_AS(channel.release_producers(-1), std::invalid_argument);
    ResultChannel never_started(2);
    never_started.release_producers(2);
    REQUIRE_FALSE(never_started.pop().has_value());
}

TEST_CASE("Executor produces one result per strategy and run", "[executor]") {
    std::vector<StrategyPtr> strategies = {
        find_builtin_strategy("Hi-Lo"), find_builtin_strategy("KO"), find_builtin_strategy("Omega II")
    };
    Executor executor(strategies, small_params(), 7, 42, 4);
    const ExecutionReport report = executor.execute();

    REQUIRE(report.units_requested == 21);
    REQUIRE(report.results.size() == 21);
    REQUIRE(report.failures.empty());
    REQUIRE_FALSE(report.stopped);

    std::set<std::pair<std::string, int>> units;
    for (const SimulationResult& r : report.results) units.insert({r.strategy_name, r.run_index});
    REQUIRE(units.size() == 21);
}

TEST_CASE("Executor is reproducible with a base seed", "[executor]") {
    const std::vector<StrategyPtr> strategies = {find_builtin_strategy("Hi-Lo"), find_builtin_strategy("Zen Count")};

    Executor a(strategies, small_params(), 5, 777, 3);
    Executor b(strategies, small_params(), 5, 777, 1);
    const auto ra = sorted(a.execute().results);
    const auto rb = sorted(b.execute().results);

    REQUIRE(ra.size() == rb.size());
    for (size_t i = 0; i < ra.size(); ++i) {
        REQUIRE(ra[i].seed == rb[i].seed);
        REQUIRE(ra[i].ending_balance == rb[i].ending_balance);
        REQUIRE(ra[i].hands_played == rb[i].hands_played);
    }
}

TEST_CASE("Unit seeds differ across units", "[executor]") {
    std::set<uint64_t> seeds;
    for (size_t s = 0; s < 4; ++s)
        for (int r = 0; r < 50; ++r) seeds.insert(Executor::unit_seed(1, s, r));
    REQUIRE(seeds.size() == 200);
    REQUIRE(Executor::retry_seed(5) != 5);
}

TEST_CASE("Failed units are retried once then excluded", "[executor][failure]") {
    SECTION("A single failure is absorbed by the retry") {
        auto flaky = std::make_shared<const FlakyStrategy>("flaky", 1);
        Executor executor({flaky}, small_params(), 1, 3, 1);
        const ExecutionReport report = executor.execute();
        REQUIRE(report.results.size() == 1);
        REQUIRE(report.failures.empty());
    }

    SECTION("A unit failing twice is excluded with a diagnostic") {
        auto broken = std::make_shared<const FlakyStrategy>("broken", 1000000);
        Executor executor({broken}, small_params(), 3, 3, 2);
        const ExecutionReport report = executor.execute();
        REQUIRE(report.results.empty());
        REQUIRE(report.failures.size() == 3);
        REQUIRE(report.failures.front().strategy_name == "broken");
        REQUIRE(report.failures.front().reason == "flaky strategy failure");
    }
}

TEST_CASE("Stop requested before execution abandons every unit", "[executor]") {
    Executor executor({find_builtin_strategy("Hi-Lo")}, small_params(), 10, 1, 2);
    executor.request_stop();
    const ExecutionReport report = executor.execute();
    REQUIRE(report.stopped);
    REQUIRE(report.results.empty());
    REQUIRE(report.units_requested == 10);
}

TEST_CASE("A fully dealt single deck never runs out mid-round", "[executor][shoe]") {
    RunParameters params;
    params.rules.num_decks   = 1;
    params.rules.penetration = 1.0;
    params.table_balance     = std::numeric_limits<double>::infinity();
    params.player_balance    = 1e7;
    params.max_hands         = 2000;

    const std::vector<StrategyPtr> strategies = {
        std::make_shared<const SplitHitterStrategy>(), find_builtin_strategy("Hi-Lo")
    };
    Executor executor(strategies, params, 50, 7, 4);
    const ExecutionReport report = executor.execute();

    REQUIRE(report.failures.empty());
    REQUIRE(report.results.size() == 100);
    for (const SimulationResult& r : report.results) {
        REQUIRE(r.terminal_reason == TerminalReason::HAND_LIMIT_REACHED);
        REQUIRE(r.hands_played == 2000);
    }
}

TEST_CASE("Executor rejects null strategies", "[executor]") {
    REQUIRE_THROWS_AS(Executor({StrategyPtr{}}, small_params(), 1), std::invalid_argument);
}
