#include "price_quantizer.hpp"
#include "logging/logs/snapshot_logs.hpp"
#include <cmath>

using FtseTracker::Logging::SnapshotLogs;

namespace FtseTracker {
namespace Core {

double round_to_quarter(double raw_price) {
    if (!std::isfinite(raw_price)) {
        SnapshotLogs::log_quantizer_non_finite_input(raw_price);
        return raw_price;
    }

    double integer_part = std::floor(raw_price);
    double fraction = raw_price - integer_part;

    if (fraction < 0.125) {
        return integer_part;
    }
    if (fraction < 0.375) {
        return integer_part + 0.25;
    }
    if (fraction < 0.625) {
        return integer_part + 0.5;
    }
    if (fraction < 0.875) {
        return integer_part + 0.75;
    }
    return integer_part + 1.0;
}

} // namespace Core
} // namespace FtseTracker
