#include "snapshot_json.hpp"
#include "utils/time_utils.hpp"

using json = nlohmann::json;

namespace FtseTracker {
namespace API {

json snapshot_to_json(const Core::Snapshot& snapshot) {
    json snapshot_json;
    snapshot_json["code"] = snapshot.code;
    snapshot_json["name"] = snapshot.name;
    snapshot_json["price"] = snapshot.price;
    snapshot_json["change"] = snapshot.change;
    snapshot_json["changePercent"] = snapshot.change_percent;
    snapshot_json["timestamp"] = TimeUtils::to_epoch_seconds(snapshot.captured_at);
    snapshot_json["taipei_time"] = snapshot.captured_at_local;
    snapshot_json["source"] = snapshot.source_label;
    snapshot_json["tx_price"] = snapshot.derived_price;
    snapshot_json["tx_change"] = snapshot.derived_offset;
    snapshot_json["is_market_hours"] = snapshot.market_open;
    if (snapshot.error) {
        snapshot_json["error"] = *snapshot.error;
    }
    return snapshot_json;
}

} // namespace API
} // namespace FtseTracker
