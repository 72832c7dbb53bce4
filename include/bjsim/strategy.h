#ifndef BJSIM_STRATEGY_H
#define BJSIM_STRATEGY_H

#include "core/cards.hpp"
#include "bjsim/common_types.h"
#include "bjsim/hand.h"
#include <memory>
#include <string>

namespace bj_sim {

// Contrat d'une stratégie de comptage.
//
// Une instance est partagée en lecture seule par toutes les simulations qui
// l'utilisent (éventuellement sur plusieurs threads) : l'état du comptage vit
// dans le CountTracker de chaque simulation, jamais dans la stratégie.
// Toutes les méthodes doivent donc être const et sans effet de bord.
//
// Le moteur ne fait confiance à aucune valeur de retour : une mise hors limites
// est bornée, un coup illégal est remplacé par STAND.
class Strategy {
public:
    virtual ~Strategy() = default;

    // Identifiant unique, utilisé pour regrouper les résultats.
    virtual std::string name() const = 0;

    // Montant de la mise pour la prochaine main.
    virtual double bet_amount(double true_count, const TableRules& rules, double bankroll) const = 0;

    virtual Decision play_decision(const Hand& hand, Card dealer_upcard,
                                   double true_count, const TableRules& rules) const = 0;

    // Consulté uniquement si le croupier montre un as et que l'assurance est permise.
    virtual bool insurance_decision(double true_count) const = 0;

    // Poids de la carte pour le running count.
    virtual int card_weight(Card card) const = 0;
};

using StrategyPtr = std::shared_ptr<const Strategy>;

} // namespace bj_sim

#endif // BJSIM_STRATEGY_H
