#ifndef SNAPSHOT_JSON_HPP
#define SNAPSHOT_JSON_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <nlohmann/json.hpp>

namespace FtseTracker {
namespace API {

// Wire form of a snapshot. "error" is present only when the snapshot carries one.
nlohmann::json snapshot_to_json(const Core::Snapshot& snapshot);

} // namespace API
} // namespace FtseTracker

#endif // SNAPSHOT_JSON_HPP
