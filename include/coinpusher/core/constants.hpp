#ifndef COINPUSHER_CONSTANTS_HPP
#define COINPUSHER_CONSTANTS_HPP

#include "coinpusher/core/game_config.hpp"

namespace GameConstants {

    // Truly global constants
    extern const double Pi;

    /**
     * @brief The canonical tuning the game ships with.
     */
    GameConfig defaultConfig();

}

#endif // COINPUSHER_CONSTANTS_HPP
