#ifndef BJSIM_ERRORS_H
#define BJSIM_ERRORS_H

#include <stdexcept>
#include <string>

namespace bj_sim {

// Configuration invalide : fatale, levée avant le lancement de toute simulation.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Le sabot a été vidé sans remélange intermédiaire (bug de logique de remélange).
// Fatale pour la simulation concernée, qui est exclue de l'agrégation.
class ShoeExhausted : public std::runtime_error {
public:
    explicit ShoeExhausted(const std::string& what) : std::runtime_error(what) {}
};

// Le joueur ne peut plus miser le minimum de la table.
// Condition terminale attendue (raison "bankrupt"), pas une erreur.
class InsufficientFunds : public std::runtime_error {
public:
    explicit InsufficientFunds(const std::string& what) : std::runtime_error(what) {}
};

} // namespace bj_sim

#endif // BJSIM_ERRORS_H
