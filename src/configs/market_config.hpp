// MarketConfig.hpp
#ifndef MARKET_CONFIG_HPP
#define MARKET_CONFIG_HPP

#include <string>

struct SessionConfig {
    std::string time_zone_name = "Asia/Taipei";             // Named zone the session window is expressed in
    int open_seconds_of_day = 8 * 3600 + 45 * 60;           // 08:45:00, inclusive
    int close_seconds_of_day = 13 * 3600 + 45 * 60;         // 13:45:00, inclusive
};

struct DerivedConfig {
    double coefficient = 12.28065515714918;                 // Index points to futures points
    double baseline = 27556.0;                              // Futures reference level for the offset
};

struct FallbackConfig {
    double price = 1637.5;                                  // Default snapshot price
    double change = -68.3;                                  // Default snapshot change
    double change_percent = -4.0;                           // Default snapshot percent change
    std::string label = "預設數據";                          // Provenance label of the default snapshot
    int validity_window_seconds = 300;                      // Reuse window of the last good snapshot
};

struct MarketConfig {
    SessionConfig session;
    DerivedConfig derived;
    FallbackConfig fallback;
};

#endif // MARKET_CONFIG_HPP
