#pragma once
// Resolves dotted paths with array indices ("a.b[2].c") against a document.
//
//   SEQUENTIAL  walks each level's fields in stored order until the name
//               matches, reporting the field's ordinal position (cost grows
//               with position, like a length-prefixed binary format).
//   INDEXED     resolves each level with a keyed lookup (position unknown).
//
// Every step is reported to an optional TraversalTimer under the operation id.
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "operation.hpp"
#include "traversal_timer.hpp"

namespace docbench {

enum class TraversalStrategy { SEQUENTIAL, INDEXED };

inline const char* traversal_strategy_str(TraversalStrategy s) {
    switch (s) {
        case TraversalStrategy::SEQUENTIAL: return "sequential";
        case TraversalStrategy::INDEXED:    return "indexed";
    }
    return "??";
}

// Throws std::invalid_argument for anything but "sequential" / "indexed"
TraversalStrategy parse_traversal_strategy(const std::string& s);

struct PathSegment {
    std::string field;           // empty for a bare "[n]" segment
    std::vector<int> indices;    // "a[1][2]" -> field a, indices {1, 2}
};

// Throws std::invalid_argument on malformed paths ("a..b", "a[x]", "a[1")
std::vector<PathSegment> parse_path(const std::string& path);

// "a.b[2].c" -> {"a","b","2","c"} (PostgreSQL text[] path literal; elements
// quoted, '"' and '\' escaped)
std::string to_pg_text_path(const std::string& path);

// Projections keep whole arrays: "a.items[2].name" -> "a.items"; "" when the
// path starts with an index
std::string projection_root(const std::string& path);

// "a.b[2].c" -> "/a/b/2/c"
std::string to_json_pointer(const std::string& path);

class DocumentNavigator {
public:
    explicit DocumentNavigator(TraversalStrategy strategy, TraversalTimer* timer = nullptr)
        : strategy_(strategy), timer_(timer) {}

    [[nodiscard]] TraversalStrategy strategy() const noexcept { return strategy_; }

    // nullptr when any step of the path does not exist
    template <typename Json>
    const Json* resolve(const Json& doc, const std::string& path, const std::string& operation_id) const {
        return resolve(doc, parse_path(path), operation_id);
    }

    template <typename Json>
    const Json* resolve(const Json& doc, const std::vector<PathSegment>& segments,
                        const std::string& operation_id) const {
        const Json* current = &doc;
        int depth_entered = 0;

        for (size_t s = 0; s < segments.size() && current; ++s) {
            const PathSegment& seg = segments[s];

            if (!seg.field.empty()) {
                if (!current->is_object()) { current = nullptr; break; }
                if (s > 0) {
                    note_enter_nested(operation_id, seg.field);
                    ++depth_entered;
                }
                current = find_field(*current, seg.field, operation_id);
            }

            for (int index : seg.indices) {
                if (!current || !current->is_array()) { current = nullptr; break; }
                if (timer_) {
                    timer_->enter_array(operation_id, seg.field);
                    timer_->record_array_element_access(operation_id, seg.field, index);
                    timer_->exit_array(operation_id);
                }
                if (index < 0 || static_cast<size_t>(index) >= current->size()) {
                    current = nullptr;
                    break;
                }
                current = &(*current)[static_cast<size_t>(index)];
            }
        }

        for (int i = 0; i < depth_entered; ++i) note_exit_nested(operation_id);
        return current;
    }

private:
    template <typename Json>
    const Json* find_field(const Json& object, const std::string& name, const std::string& operation_id) const {
        if (strategy_ == TraversalStrategy::SEQUENTIAL) {
            int position = 0;
            for (auto it = object.begin(); it != object.end(); ++it, ++position) {
                if (it.key() == name) {
                    if (timer_) timer_->record_field_access(operation_id, name, position);
                    return &it.value();
                }
            }
            return nullptr;
        }

        auto it = object.find(name);
        if (it == object.end()) return nullptr;
        if (timer_) timer_->record_field_access(operation_id, name);
        return &it.value();
    }

    void note_enter_nested(const std::string& operation_id, const std::string& field) const {
        if (timer_) timer_->enter_nested_document(operation_id, field);
    }

    void note_exit_nested(const std::string& operation_id) const {
        if (timer_) timer_->exit_nested_document(operation_id);
    }

    TraversalStrategy strategy_;
    TraversalTimer* timer_;
};

// Resolves every path of a client-side projection inside one traversal
// context of `timer`, then closes the context. Samples go to `collector`
// when given. The breakdown is nullopt only
// if the context could not be opened.
std::optional<TraversalBreakdown> traverse_paths(TraversalTimer& timer, TraversalStrategy strategy,
                                                 const Document& doc, const std::vector<std::string>& paths,
                                                 const std::string& operation_id,
                                                 MetricsCollector* collector = nullptr);

} // namespace docbench
