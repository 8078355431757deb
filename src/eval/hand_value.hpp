#ifndef BLACKJACK_HAND_VALUE_HPP
#define BLACKJACK_HAND_VALUE_HPP

#include "core/cards.hpp"

namespace blackjack {

constexpr int BLACKJACK_VALUE = 21;

// --- Interface de l'évaluateur ---

/**
 * @brief Points d'une carte seule: 2-10 valeur faciale, J/Q/K = 10, As = 11.
 * @throws std::invalid_argument si la carte est INVALID_CARD.
 */
int card_points(Card c);

/**
 * @brief Meilleure valeur de la main: chaque As compte 11 puis passe à 1
 *        tant que le total dépasse 21. Indépendant de l'ordre des cartes.
 * @return La plus grande valeur <= 21 atteignable, sinon la valeur minimale.
 */
int hand_value(const Hand& hand);

/**
 * @brief Vrai si au moins un As compte encore 11 dans hand_value().
 */
bool is_soft(const Hand& hand);

/**
 * @brief Blackjack naturel: exactement 2 cartes et valeur 21.
 */
bool is_blackjack(const Hand& hand);

bool is_bust(const Hand& hand);

} // namespace blackjack

#endif // BLACKJACK_HAND_VALUE_HPP
