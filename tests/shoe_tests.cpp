#include <catch2/catch_test_macros.hpp>
#include "core/shoe.hpp"
#include "core/cards.hpp"

#include <array>
#include <stdexcept>
#include <vector>

using namespace blackjack;

TEST_CASE("Shoe creation", "[shoe]") {
    SECTION("6 decks hold 312 cards, each card six times") {
        Shoe shoe(6, 1234);
        REQUIRE(shoe.remaining() == 312);
        REQUIRE(shoe.capacity() == 312);
        REQUIRE(shoe.num_decks() == 6);
        REQUIRE(shoe.reshuffle_count() == 0);
        REQUIRE_FALSE(shoe.needs_reshuffle());

        std::array<int, CARDS_PER_DECK> counts{};
        for (int i = 0; i < 312; ++i) {
            Card c = shoe.draw();
            REQUIRE(c < INVALID_CARD);
            counts[c]++;
        }
        for (int n : counts) REQUIRE(n == 6);
        REQUIRE(shoe.reshuffle_count() == 0);
    }

    SECTION("Invalid arguments") {
        REQUIRE_THROWS_AS(Shoe(0, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(Shoe(-2, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(Shoe(1, 1, 1.5), std::invalid_argument);
        REQUIRE_THROWS_AS(Shoe(1, 1, -0.1), std::invalid_argument);
    }
}

TEST_CASE("Shoe draw reshuffles when empty", "[shoe]") {
    Shoe shoe(6, 99);
    for (int i = 0; i < 312; ++i) shoe.draw();
    REQUIRE(shoe.remaining() == 0);
    REQUIRE(shoe.reshuffle_count() == 0);

    Card c = shoe.draw();
    REQUIRE(c < INVALID_CARD);
    REQUIRE(shoe.reshuffle_count() == 1);
    REQUIRE(shoe.capacity() == 312);
    REQUIRE(shoe.remaining() == 311);
}

TEST_CASE("Shoe shuffle is seeded", "[shoe]") {
    auto first_cards = [](uint32_t seed) {
        Shoe shoe(2, seed);
        std::vector<Card> cards;
        for (int i = 0; i < 30; ++i) cards.push_back(shoe.draw());
        return cards;
    };
    REQUIRE(first_cards(7) == first_cards(7));
    REQUIRE(first_cards(7) != first_cards(8));
}

TEST_CASE("Shoe low-capacity policy", "[shoe]") {
    Shoe shoe(1, 5); // 52 cartes, seuil 0.2 -> 10.4
    for (int i = 0; i < 41; ++i) shoe.draw();
    REQUIRE(shoe.remaining() == 11);
    REQUIRE_FALSE(shoe.needs_reshuffle());

    shoe.draw();
    REQUIRE(shoe.remaining() == 10);
    REQUIRE(shoe.needs_reshuffle());

    shoe.reshuffle();
    REQUIRE(shoe.remaining() == 52);
    REQUIRE(shoe.capacity() == 52);
    REQUIRE(shoe.reshuffle_count() == 1);
    REQUIRE_FALSE(shoe.needs_reshuffle());
}

TEST_CASE("Shoe stacked for testing", "[shoe]") {
    Shoe shoe(1, 3);
    shoe.set_cards_for_testing(hand_from_string("Ah Kd 2c"));
    REQUIRE(shoe.remaining() == 3);
    REQUIRE(shoe.capacity() == 3);
    REQUIRE(shoe.draw() == card_from_string("Ah"));
    REQUIRE(shoe.draw() == card_from_string("Kd"));
    REQUIRE(shoe.draw() == card_from_string("2c"));

    // Le sabot empilé épuisé est remplacé par un sabot complet
    shoe.draw();
    REQUIRE(shoe.reshuffle_count() == 1);
    REQUIRE(shoe.remaining() == 51);

    REQUIRE_THROWS_AS(shoe.set_cards_for_testing({INVALID_CARD}), std::invalid_argument);
}
