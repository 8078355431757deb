#include "core/shoe.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <algorithm>  // Pour std::shuffle
#include <numeric>    // Pour std::iota

namespace blackjack {

Shoe::Shoe(int num_decks, uint32_t seed, double reshuffle_threshold)
    : num_decks_(num_decks),
      reshuffle_threshold_(reshuffle_threshold),
      rng_(seed)
{
    if (num_decks <= 0) throw std::invalid_argument("Num decks must be > 0");
    if (reshuffle_threshold < 0.0 || reshuffle_threshold > 1.0) {
        throw std::invalid_argument("Reshuffle threshold must be in [0, 1]");
    }
    build();
    spdlog::debug("Shoe initialisé: {} paquets, {} cartes, seuil {}", num_decks_, capacity_, reshuffle_threshold_);
}

// Remplit le sabot (num_decks x 52) puis mélange TOUT le paquet
void Shoe::build() {
    cards_.resize(static_cast<size_t>(num_decks_) * CARDS_PER_DECK);
    for (size_t i = 0; i < cards_.size(); ++i) {
        cards_[i] = static_cast<Card>(i % CARDS_PER_DECK);
    }
    std::shuffle(cards_.begin(), cards_.end(), rng_);
    next_card_index_ = 0;
    capacity_ = cards_.size();
}

void Shoe::reshuffle() {
    build();
    ++reshuffle_count_;
    spdlog::debug("Shoe remélangé ({} cartes, remélange #{})", capacity_, reshuffle_count_);
}

Card Shoe::draw() {
    if (next_card_index_ >= cards_.size()) {
        spdlog::info("Sabot vide: création d'un nouveau sabot de {} paquets.", num_decks_);
        reshuffle();
    }
    return cards_[next_card_index_++];
}

bool Shoe::needs_reshuffle() const {
    return static_cast<double>(remaining()) < static_cast<double>(capacity_) * reshuffle_threshold_;
}

void Shoe::set_cards_for_testing(const std::vector<Card>& cards_in_draw_order) {
    for (Card c : cards_in_draw_order) {
        if (c >= INVALID_CARD) {
            throw std::invalid_argument("Stacked shoe contains an invalid card.");
        }
    }
    cards_ = cards_in_draw_order;
    next_card_index_ = 0;
    capacity_ = cards_.size();
}

} // namespace blackjack
