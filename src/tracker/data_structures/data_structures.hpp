#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <chrono>
#include <optional>

namespace FtseTracker {
namespace Core {

enum class SnapshotSource {
    LIVE_FETCH,
    DEFAULT_FALLBACK
};

enum class RefreshOutcome {
    SUCCESS,                 // Fresh snapshot written
    REUSED_LAST_SNAPSHOT,    // Last snapshot kept with the error stamped on it
    DEFAULT_FALLBACK         // Fixed default snapshot written
};

struct RawQuoteFields {
    double price;
    double change;
    double change_percent;

    RawQuoteFields() : price(0.0), change(0.0), change_percent(0.0) {}
    RawQuoteFields(double price_value, double change_value, double change_percent_value)
        : price(price_value), change(change_value), change_percent(change_percent_value) {}
};

struct DerivedValues {
    double derived_price;
    double derived_offset;

    DerivedValues() : derived_price(0.0), derived_offset(0.0) {}
};

/**
 * Published state of the tracked index.
 * price is always quarter-rounded; derived_price and derived_offset always
 * come from the price of the same snapshot.
 */
struct Snapshot {
    std::string code;
    std::string name;
    double price;
    double change;
    double change_percent;
    double derived_price;
    double derived_offset;
    std::chrono::system_clock::time_point captured_at;   // Drives the validity window
    std::string captured_at_local;                       // Display only
    SnapshotSource source;
    std::string source_label;
    bool market_open;
    std::optional<std::string> error;                    // Set on fallback or stale reuse

    Snapshot()
        : price(0.0), change(0.0), change_percent(0.0), derived_price(0.0), derived_offset(0.0),
          captured_at(), source(SnapshotSource::LIVE_FETCH), market_open(false) {}
};

// Copy of the store contents taken under its lock.
struct StoreReading {
    std::optional<Snapshot> snapshot;
    std::chrono::system_clock::time_point last_write_time;   // Scheduling clock
};

inline const char* to_string(SnapshotSource source) {
    switch (source) {
        case SnapshotSource::LIVE_FETCH:
            return "LIVE_FETCH";
        case SnapshotSource::DEFAULT_FALLBACK:
            return "DEFAULT_FALLBACK";
        default:
            return "UNKNOWN";
    }
}

inline const char* to_string(RefreshOutcome outcome) {
    switch (outcome) {
        case RefreshOutcome::SUCCESS:
            return "SUCCESS";
        case RefreshOutcome::REUSED_LAST_SNAPSHOT:
            return "REUSED_LAST_SNAPSHOT";
        case RefreshOutcome::DEFAULT_FALLBACK:
            return "DEFAULT_FALLBACK";
        default:
            return "UNKNOWN";
    }
}

} // namespace Core
} // namespace FtseTracker

#endif // DATA_STRUCTURES_HPP
