#ifndef BJSIM_TABLE_H
#define BJSIM_TABLE_H

#include "bjsim/common_types.h"
#include <vector>
#include <cstddef>

namespace bj_sim {

// Solde du joueur et mises en cours (une par main active après les splits).
class PlayerAccount {
public:
    explicit PlayerAccount(double starting_balance);

    double balance() const { return balance_; }
    double starting_balance() const { return starting_balance_; }

    bool can_afford(double amount) const { return amount <= balance_; }

    // Débite une nouvelle mise, renvoie l'index de la mise (= index de la main).
    // Lève InsufficientFunds si le solde ne suffit pas.
    size_t open_bet(double amount);

    // Ajoute au montant d'une mise existante (double).
    void raise_bet(size_t bet_index, double amount);

    double bet(size_t bet_index) const;
    const std::vector<double>& bets() const { return bets_; }
    double total_bet() const;

    // Débite/crédite hors mises de main (assurance).
    void debit(double amount);
    void credit(double amount);

    // Fin de main : les mises ont toutes été réglées.
    void clear_bets() { bets_.clear(); }

private:
    double starting_balance_;
    double balance_;
    std::vector<double> bets_;
};

// Table : règles immuables + banque de la maison.
// Tous les mouvements d'argent entre le joueur et la maison passent par ici.
class Table {
public:
    Table(TableRules rules, double table_balance);

    const TableRules& rules() const { return rules_; }
    double balance() const { return balance_; }

    // La maison peut-elle payer un blackjack sur cette mise ?
    bool can_cover(double bet) const;
    // Plus grosse mise que la maison peut encore couvrir
    double max_coverable_bet() const;

    // Mise perdue : la maison encaisse.
    void collect(double amount);

    // Rend la mise et paie stake * multiplier (1.0 = 1:1, 1.5 = 3:2, 0 = push),
    // dans la limite de la banque : le solde de la table ne devient jamais négatif.
    // Renvoie le gain effectivement versé.
    double pay(PlayerAccount& account, double stake, double multiplier);

    // Abandon : la moitié de la mise est rendue, l'autre moitié encaissée.
    void refund_half(PlayerAccount& account, double stake);

private:
    const TableRules rules_;
    double balance_;
};

} // namespace bj_sim

#endif // BJSIM_TABLE_H
