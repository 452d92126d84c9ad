#include "coinpusher/game/game_state.hpp"

std::string phaseName(GamePhase phase) {
    switch (phase) {
        case GamePhase::Menu:     return "MENU";
        case GamePhase::Playing:  return "PLAYING";
        case GamePhase::Shop:     return "SHOP";
        case GamePhase::GameOver: return "GAME_OVER";
        default: return "UNKNOWN";
    }
}

Deck::Deck() : counts{} {}

int Deck::count(CoinType type) const {
    return counts[CoinCatalog::indexOf(type)];
}

void Deck::add(CoinType type, int amount) {
    int &slot = counts[CoinCatalog::indexOf(type)];
    slot += amount;
    if (slot < 0) {
        slot = 0;
    }
}

bool Deck::take(CoinType type) {
    int &slot = counts[CoinCatalog::indexOf(type)];
    if (slot <= 0) {
        return false;
    }
    --slot;
    return true;
}

int Deck::total() const {
    int sum = 0;
    for (int c : counts) {
        sum += c;
    }
    return sum;
}

Deck Deck::initial() {
    Deck deck;
    deck.add(CoinType::Standard, 30);
    deck.add(CoinType::Splitter, 2);
    deck.add(CoinType::Heavy, 1);
    deck.add(CoinType::Seed, 3);
    deck.add(CoinType::Water, 3);
    return deck;
}

int GameState::artifactLevel(const std::string &id) const {
    for (const auto &artifact : artifacts) {
        if (artifact.id == id) {
            return artifact.level;
        }
    }
    return 0;
}
