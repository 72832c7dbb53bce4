#include "bjsim/table.h"
#include "bjsim/errors.h"
#include "spdlog/spdlog.h"
#include <algorithm> // Pour std::min, std::max
#include <numeric> // Pour std::accumulate
#include <stdexcept>
#include <string>
#include <utility>

namespace bj_sim {

// -----------------------------------------------------------------------------
//  PlayerAccount
// -----------------------------------------------------------------------------
PlayerAccount::PlayerAccount(double starting_balance)
    : starting_balance_(starting_balance),
      balance_(starting_balance)
{
    if (starting_balance < 0.0) throw std::invalid_argument("Player balance must be >= 0");
}

size_t PlayerAccount::open_bet(double amount) {
    if (amount <= 0.0) throw std::invalid_argument("Bet must be a positive amount");
    if (!can_afford(amount)) {
        throw InsufficientFunds("Cannot bet " + std::to_string(amount) +
                                " with a balance of " + std::to_string(balance_));
    }
    balance_ -= amount;
    bets_.push_back(amount);
    return bets_.size() - 1;
}

void PlayerAccount::raise_bet(size_t bet_index, double amount) {
    if (bet_index >= bets_.size()) throw std::out_of_range("Bet index out of range");
    if (!can_afford(amount)) {
        throw InsufficientFunds("Cannot raise bet by " + std::to_string(amount));
    }
    balance_ -= amount;
    bets_[bet_index] += amount;
}

double PlayerAccount::bet(size_t bet_index) const {
    if (bet_index >= bets_.size()) throw std::out_of_range("Bet index out of range");
    return bets_[bet_index];
}

double PlayerAccount::total_bet() const {
    return std::accumulate(bets_.begin(), bets_.end(), 0.0);
}

void PlayerAccount::debit(double amount) {
    if (!can_afford(amount)) {
        throw InsufficientFunds("Cannot debit " + std::to_string(amount));
    }
    balance_ -= amount;
}

void PlayerAccount::credit(double amount) {
    balance_ += amount;
}

// -----------------------------------------------------------------------------
//  Table
// -----------------------------------------------------------------------------
Table::Table(TableRules rules, double table_balance)
    : rules_(std::move(rules)),
      balance_(table_balance) {}

bool Table::can_cover(double bet) const {
    return balance_ >= bet * rules_.blackjack_payout;
}

double Table::max_coverable_bet() const {
    return balance_ / rules_.blackjack_payout;
}

void Table::collect(double amount) {
    balance_ += amount;
}

double Table::pay(PlayerAccount& account, double stake, double multiplier) {
    // La maison ne paie jamais plus que ce qu'elle possède
    const double winnings = std::min(stake * multiplier, std::max(balance_, 0.0));
    if (winnings < stake * multiplier) {
        spdlog::debug("Banque de la table épuisée : gain {} ramené à {}.", stake * multiplier, winnings);
    }
    balance_ -= winnings;
    account.credit(stake + winnings);
    return winnings;
}

void Table::refund_half(PlayerAccount& account, double stake) {
    const double half = stake / 2.0;
    balance_ += stake - half;
    account.credit(half);
}

} // namespace bj_sim
