#ifndef BLACKJACK_CORE_SHOE_HPP
#define BLACKJACK_CORE_SHOE_HPP

#include "core/cards.hpp"
#include <cstdint>
#include <vector>
#include <random>   // Pour std::mt19937

namespace blackjack {

constexpr double DEFAULT_RESHUFFLE_THRESHOLD = 0.2;

// Sabot: plusieurs paquets de 52 cartes mélangés ensemble.
// Ne se vide jamais du point de vue de l'appelant: draw() reconstruit le sabot
// complet s'il est vide.
class Shoe {
public:
    Shoe(int num_decks, uint32_t seed, double reshuffle_threshold = DEFAULT_RESHUFFLE_THRESHOLD);
    ~Shoe() = default;

    Card draw();
    void reshuffle(); // Reconstruit le sabot complet et met à jour la capacité

    // Vrai si remaining() < capacity() * seuil (à vérifier entre deux manches)
    bool needs_reshuffle() const;

    size_t remaining() const { return cards_.size() - next_card_index_; }
    size_t capacity() const { return capacity_; }
    int num_decks() const { return num_decks_; }
    double reshuffle_threshold() const { return reshuffle_threshold_; }
    int reshuffle_count() const { return reshuffle_count_; }

    // Empile le sabot: draw() rendra ces cartes dans l'ordre donné.
    void set_cards_for_testing(const std::vector<Card>& cards_in_draw_order);

private:
    void build();

    std::vector<Card> cards_;
    size_t            next_card_index_ = 0;
    size_t            capacity_        = 0;
    int               num_decks_;
    double            reshuffle_threshold_;
    int               reshuffle_count_ = 0;
    std::mt19937      rng_;
};

} // namespace blackjack

#endif // BLACKJACK_CORE_SHOE_HPP
