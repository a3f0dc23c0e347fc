#pragma once
// Decomposition of one operation's latency into named components.
//
// Thirteen base dimensions plus an open map of platform-specific durations.
// Validation is fail-fast: a missing (unset) or negative duration rejects
// construction before anything is derived. Derived values are computed on
// demand from the base fields; percentages are 0.0 when total latency is 0.
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "../utils/timer.hpp"

namespace docbench {

class OverheadBreakdown {
public:
    // Every field must be set; use Builder for zero-defaulted construction
    struct Components {
        std::optional<Duration> total_latency;
        std::optional<Duration> connection_acquisition;
        std::optional<Duration> connection_release;
        std::optional<Duration> serialization_time;
        std::optional<Duration> wire_transmit_time;
        std::optional<Duration> server_execution_time;
        std::optional<Duration> server_parse_time;
        std::optional<Duration> server_traversal_time;
        std::optional<Duration> server_index_time;
        std::optional<Duration> server_fetch_time;
        std::optional<Duration> wire_receive_time;
        std::optional<Duration> deserialization_time;
        std::optional<Duration> client_traversal_time;
    };

    class Builder;

    // Throws std::invalid_argument on a missing or negative duration
    explicit OverheadBreakdown(const Components& components,
                               std::map<std::string, Duration> platform_specific = {});

    static Builder builder();

    // Breakdown carrying only the total, used when nothing finer was captured
    static OverheadBreakdown total_only(Duration total_latency);

    [[nodiscard]] Duration total_latency() const noexcept { return total_latency_; }
    [[nodiscard]] Duration connection_acquisition() const noexcept { return connection_acquisition_; }
    [[nodiscard]] Duration connection_release() const noexcept { return connection_release_; }
    [[nodiscard]] Duration serialization_time() const noexcept { return serialization_time_; }
    [[nodiscard]] Duration wire_transmit_time() const noexcept { return wire_transmit_time_; }
    [[nodiscard]] Duration server_execution_time() const noexcept { return server_execution_time_; }
    [[nodiscard]] Duration server_parse_time() const noexcept { return server_parse_time_; }
    [[nodiscard]] Duration server_traversal_time() const noexcept { return server_traversal_time_; }
    [[nodiscard]] Duration server_index_time() const noexcept { return server_index_time_; }
    [[nodiscard]] Duration server_fetch_time() const noexcept { return server_fetch_time_; }
    [[nodiscard]] Duration wire_receive_time() const noexcept { return wire_receive_time_; }
    [[nodiscard]] Duration deserialization_time() const noexcept { return deserialization_time_; }
    [[nodiscard]] Duration client_traversal_time() const noexcept { return client_traversal_time_; }

    [[nodiscard]] const std::map<std::string, Duration>& platform_specific() const noexcept {
        return platform_specific_;
    }

    // Everything except fetching the data itself; floored at zero
    [[nodiscard]] Duration total_overhead() const noexcept;
    [[nodiscard]] Duration traversal_overhead() const noexcept {
        return server_traversal_time_ + client_traversal_time_;
    }
    [[nodiscard]] Duration network_overhead() const noexcept {
        return wire_transmit_time_ + wire_receive_time_;
    }
    [[nodiscard]] Duration serialization_overhead() const noexcept {
        return serialization_time_ + deserialization_time_;
    }
    [[nodiscard]] Duration connection_overhead() const noexcept {
        return connection_acquisition_ + connection_release_;
    }

    [[nodiscard]] double overhead_percentage() const noexcept { return percentage_of_total(total_overhead()); }
    [[nodiscard]] double traversal_percentage() const noexcept { return percentage_of_total(traversal_overhead()); }
    [[nodiscard]] double network_percentage() const noexcept { return percentage_of_total(network_overhead()); }
    [[nodiscard]] double serialization_percentage() const noexcept {
        return percentage_of_total(serialization_overhead());
    }
    [[nodiscard]] double connection_percentage() const noexcept {
        return percentage_of_total(connection_overhead());
    }

    // (name, value) for each of the 13 base dimensions, in declaration order
    [[nodiscard]] std::vector<std::pair<const char*, Duration>> dimensions() const;

    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const OverheadBreakdown& other) const;
    bool operator!=(const OverheadBreakdown& other) const { return !(*this == other); }

private:
    [[nodiscard]] double percentage_of_total(Duration part) const noexcept;

    Duration total_latency_;
    Duration connection_acquisition_;
    Duration connection_release_;
    Duration serialization_time_;
    Duration wire_transmit_time_;
    Duration server_execution_time_;
    Duration server_parse_time_;
    Duration server_traversal_time_;
    Duration server_index_time_;
    Duration server_fetch_time_;
    Duration wire_receive_time_;
    Duration deserialization_time_;
    Duration client_traversal_time_;
    std::map<std::string, Duration> platform_specific_;
};

// Accumulates dimensions incrementally; anything left unset is zero
class OverheadBreakdown::Builder {
public:
    Builder& total_latency(Duration d) { c_.total_latency = d; return *this; }
    Builder& connection_acquisition(Duration d) { c_.connection_acquisition = d; return *this; }
    Builder& connection_release(Duration d) { c_.connection_release = d; return *this; }
    Builder& serialization_time(Duration d) { c_.serialization_time = d; return *this; }
    Builder& wire_transmit_time(Duration d) { c_.wire_transmit_time = d; return *this; }
    Builder& server_execution_time(Duration d) { c_.server_execution_time = d; return *this; }
    Builder& server_parse_time(Duration d) { c_.server_parse_time = d; return *this; }
    Builder& server_traversal_time(Duration d) { c_.server_traversal_time = d; return *this; }
    Builder& server_index_time(Duration d) { c_.server_index_time = d; return *this; }
    Builder& server_fetch_time(Duration d) { c_.server_fetch_time = d; return *this; }
    Builder& wire_receive_time(Duration d) { c_.wire_receive_time = d; return *this; }
    Builder& deserialization_time(Duration d) { c_.deserialization_time = d; return *this; }
    Builder& client_traversal_time(Duration d) { c_.client_traversal_time = d; return *this; }

    Builder& add_platform_specific(const std::string& name, Duration d) {
        platform_[name] = d;
        return *this;
    }

    [[nodiscard]] OverheadBreakdown build() const;

private:
    Components c_;
    std::map<std::string, Duration> platform_;
};

} // namespace docbench
