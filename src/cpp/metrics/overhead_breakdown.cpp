#include "overhead_breakdown.hpp"

#include <stdexcept>

namespace docbench {

namespace {

Duration require_valid(const std::optional<Duration>& d, const char* field) {
    if (!d) {
        throw std::invalid_argument(std::string(field) + " is missing");
    }
    if (d->count() < 0) {
        throw std::invalid_argument(std::string(field) + " must not be negative (got " +
                                    std::to_string(d->count()) + " ns)");
    }
    return *d;
}

Duration zero_if_unset(const std::optional<Duration>& d) {
    return d.value_or(Duration::zero());
}

} // namespace

// Members are initialized in declaration order, so validation of every base
// field runs before the platform map is copied or anything is derived.
OverheadBreakdown::OverheadBreakdown(const Components& c,
                                     std::map<std::string, Duration> platform_specific)
    : total_latency_(require_valid(c.total_latency, "total_latency"))
    , connection_acquisition_(require_valid(c.connection_acquisition, "connection_acquisition"))
    , connection_release_(require_valid(c.connection_release, "connection_release"))
    , serialization_time_(require_valid(c.serialization_time, "serialization_time"))
    , wire_transmit_time_(require_valid(c.wire_transmit_time, "wire_transmit_time"))
    , server_execution_time_(require_valid(c.server_execution_time, "server_execution_time"))
    , server_parse_time_(require_valid(c.server_parse_time, "server_parse_time"))
    , server_traversal_time_(require_valid(c.server_traversal_time, "server_traversal_time"))
    , server_index_time_(require_valid(c.server_index_time, "server_index_time"))
    , server_fetch_time_(require_valid(c.server_fetch_time, "server_fetch_time"))
    , wire_receive_time_(require_valid(c.wire_receive_time, "wire_receive_time"))
    , deserialization_time_(require_valid(c.deserialization_time, "deserialization_time"))
    , client_traversal_time_(require_valid(c.client_traversal_time, "client_traversal_time"))
    , platform_specific_(std::move(platform_specific)) {
    for (const auto& [name, d] : platform_specific_) {
        if (d.count() < 0) {
            throw std::invalid_argument("platform-specific duration '" + name +
                                        "' must not be negative");
        }
    }
}

OverheadBreakdown::Builder OverheadBreakdown::builder() {
    return Builder{};
}

OverheadBreakdown OverheadBreakdown::total_only(Duration total_latency) {
    return builder().total_latency(total_latency).build();
}

Duration OverheadBreakdown::total_overhead() const noexcept {
    Duration d = total_latency_ - server_fetch_time_;
    return d.count() < 0 ? Duration::zero() : d;
}

double OverheadBreakdown::percentage_of_total(Duration part) const noexcept {
    if (total_latency_.count() == 0) return 0.0;
    return static_cast<double>(part.count()) * 100.0 / static_cast<double>(total_latency_.count());
}

std::vector<std::pair<const char*, Duration>> OverheadBreakdown::dimensions() const {
    return {
        {"total_latency", total_latency_},
        {"connection_acquisition", connection_acquisition_},
        {"connection_release", connection_release_},
        {"serialization_time", serialization_time_},
        {"wire_transmit_time", wire_transmit_time_},
        {"server_execution_time", server_execution_time_},
        {"server_parse_time", server_parse_time_},
        {"server_traversal_time", server_traversal_time_},
        {"server_index_time", server_index_time_},
        {"server_fetch_time", server_fetch_time_},
        {"wire_receive_time", wire_receive_time_},
        {"deserialization_time", deserialization_time_},
        {"client_traversal_time", client_traversal_time_},
    };
}

nlohmann::json OverheadBreakdown::to_json() const {
    nlohmann::json j;
    for (const auto& [name, d] : dimensions()) {
        j[std::string(name) + "_ns"] = d.count();
    }
    nlohmann::json platform = nlohmann::json::object();
    for (const auto& [name, d] : platform_specific_) {
        platform[name] = d.count();
    }
    j["platform_specific_ns"] = platform;
    j["overhead_percentage"] = overhead_percentage();
    j["traversal_percentage"] = traversal_percentage();
    return j;
}

bool OverheadBreakdown::operator==(const OverheadBreakdown& other) const {
    return dimensions() == other.dimensions() && platform_specific_ == other.platform_specific_;
}

OverheadBreakdown OverheadBreakdown::Builder::build() const {
    Components full;
    full.total_latency = zero_if_unset(c_.total_latency);
    full.connection_acquisition = zero_if_unset(c_.connection_acquisition);
    full.connection_release = zero_if_unset(c_.connection_release);
    full.serialization_time = zero_if_unset(c_.serialization_time);
    full.wire_transmit_time = zero_if_unset(c_.wire_transmit_time);
    full.server_execution_time = zero_if_unset(c_.server_execution_time);
    full.server_parse_time = zero_if_unset(c_.server_parse_time);
    full.server_traversal_time = zero_if_unset(c_.server_traversal_time);
    full.server_index_time = zero_if_unset(c_.server_index_time);
    full.server_fetch_time = zero_if_unset(c_.server_fetch_time);
    full.wire_receive_time = zero_if_unset(c_.wire_receive_time);
    full.deserialization_time = zero_if_unset(c_.deserialization_time);
    full.client_traversal_time = zero_if_unset(c_.client_traversal_time);
    return OverheadBreakdown(full, platform_);
}

} // namespace docbench
