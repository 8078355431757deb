#include <catch2/catch_test_macros.hpp>
#include "eval/hand_value.hpp"
#include "core/cards.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace blackjack;

// Helper pour créer des mains plus facilement dans les tests
Hand H(const std::string& s) { return hand_from_string(s); }

TEST_CASE("Card points", "[hand_value]") {
    REQUIRE(card_points(card_from_string("2c")) == 2);
    REQUIRE(card_points(card_from_string("9h")) == 9);
    REQUIRE(card_points(card_from_string("Td")) == 10);
    REQUIRE(card_points(card_from_string("Js")) == 10);
    REQUIRE(card_points(card_from_string("Qs")) == 10);
    REQUIRE(card_points(card_from_string("Kc")) == 10);
    REQUIRE(card_points(card_from_string("Ah")) == 11);
    REQUIRE_THROWS_AS(card_points(INVALID_CARD), std::invalid_argument);
}

TEST_CASE("Hand value with flexible Aces", "[hand_value]") {
    SECTION("Simple totals") {
        REQUIRE(hand_value({}) == 0);
        REQUIRE(hand_value(H("Kc 7d")) == 17);
        REQUIRE(hand_value(H("2c 3d 4h")) == 9);
    }

    SECTION("Aces soften one at a time") {
        REQUIRE(hand_value(H("Ah Ad 9c")) == 21);
        REQUIRE(hand_value(H("Ah Ad")) == 12);
        REQUIRE(hand_value(H("Ah Ad Ac As")) == 14);
        REQUIRE(hand_value(H("Ah 5c")) == 16);
        REQUIRE(hand_value(H("Ah 5c Kd")) == 16);
        REQUIRE(hand_value(H("Ah Kd")) == 21);
    }

    SECTION("Minimum value when even all Aces as 1 busts") {
        REQUIRE(hand_value(H("Ah Kd Qc 5s")) == 26);
        REQUIRE(hand_value(H("Kc Qd 5h")) == 25);
    }

    SECTION("Soft hands") {
        REQUIRE(is_soft(H("Ah 6c")));
        REQUIRE_FALSE(is_soft(H("Ah 6c Kd")));
        REQUIRE_FALSE(is_soft(H("Tc 7d")));
        REQUIRE(is_soft(H("Ah Ad")));
    }
}

TEST_CASE("Hand value is invariant under permutation", "[hand_value]") {
    const std::vector<std::string> hands = {
        "Ah Ad 9c", "Ah 5c Kd", "Ac 2d 3h As", "Kc Qd 5h", "Ah Ad Ac As 7c"
    };
    for (const auto& text : hands) {
        Hand h = H(text);
        const int expected = hand_value(h);
        std::sort(h.begin(), h.end());
        do {
            INFO("Hand: " << hand_to_string(h));
            REQUIRE(hand_value(h) == expected);
        } while (std::next_permutation(h.begin(), h.end()));
    }
}

TEST_CASE("Blackjack and bust status", "[hand_value]") {
    REQUIRE(is_blackjack(H("Ah Kd")));
    REQUIRE(is_blackjack(H("Tc As")));
    REQUIRE_FALSE(is_blackjack(H("Tc 5d 6h")));   // 21 mais 3 cartes
    REQUIRE_FALSE(is_blackjack(H("Ah 9d")));
    REQUIRE_FALSE(is_blackjack(H("Ah")));

    REQUIRE(is_bust(H("Kc Qd 2h")));
    REQUIRE_FALSE(is_bust(H("Kc Qd Ah")));
    REQUIRE_FALSE(is_bust(H("Tc 5d 6h")));
}
