#include "document_navigator.hpp"

#include <cctype>
#include <stdexcept>

namespace docbench {

TraversalStrategy parse_traversal_strategy(const std::string& s) {
    if (s == "sequential") return TraversalStrategy::SEQUENTIAL;
    if (s == "indexed") return TraversalStrategy::INDEXED;
    throw std::invalid_argument("unknown traversal strategy: " + s);
}

std::vector<PathSegment> parse_path(const std::string& path) {
    if (path.empty()) {
        throw std::invalid_argument("empty document path");
    }

    std::vector<PathSegment> segments;
    size_t i = 0;
    while (i <= path.size()) {
        PathSegment seg;
        size_t start = i;
        while (i < path.size() && path[i] != '.' && path[i] != '[') ++i;
        seg.field = path.substr(start, i - start);

        while (i < path.size() && path[i] == '[') {
            size_t close = path.find(']', i);
            if (close == std::string::npos) {
                throw std::invalid_argument("unterminated index in path: " + path);
            }
            std::string digits = path.substr(i + 1, close - i - 1);
            if (digits.empty()) {
                throw std::invalid_argument("empty index in path: " + path);
            }
            for (char c : digits) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    throw std::invalid_argument("non-numeric index in path: " + path);
                }
            }
            seg.indices.push_back(std::stoi(digits));
            i = close + 1;
        }

        if (seg.field.empty() && seg.indices.empty()) {
            throw std::invalid_argument("empty segment in path: " + path);
        }
        // A bare index is only meaningful at the root ("[0].a")
        if (seg.field.empty() && !segments.empty()) {
            throw std::invalid_argument("index without field in path: " + path);
        }
        segments.push_back(std::move(seg));

        if (i == path.size()) break;
        if (path[i] != '.') {
            throw std::invalid_argument("unexpected character in path: " + path);
        }
        ++i;
        if (i == path.size()) {
            throw std::invalid_argument("trailing dot in path: " + path);
        }
    }
    return segments;
}

std::string to_pg_text_path(const std::string& path) {
    std::string out = "{";
    bool first = true;
    // Every element double-quoted so separators, braces and blanks in field
    // names survive the array literal
    auto append = [&](const std::string& element) {
        if (!first) out += ',';
        first = false;
        out += '"';
        for (char c : element) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    };
    for (const auto& seg : parse_path(path)) {
        if (!seg.field.empty()) append(seg.field);
        for (int index : seg.indices) append(std::to_string(index));
    }
    out += '}';
    return out;
}

std::string projection_root(const std::string& path) {
    std::string root;
    for (const auto& seg : parse_path(path)) {
        if (seg.field.empty()) break;
        if (!root.empty()) root += '.';
        root += seg.field;
        if (!seg.indices.empty()) break;
    }
    return root;
}

std::string to_json_pointer(const std::string& path) {
    std::string out;
    for (const auto& seg : parse_path(path)) {
        if (!seg.field.empty()) {
            out += '/';
            for (char c : seg.field) {
                if (c == '~') out += "~0";
                else if (c == '/') out += "~1";
                else out += c;
            }
        }
        for (int index : seg.indices) {
            out += '/';
            out += std::to_string(index);
        }
    }
    return out;
}

std::optional<TraversalBreakdown> traverse_paths(TraversalTimer& timer, TraversalStrategy strategy,
                                                 const Document& doc, const std::vector<std::string>& paths,
                                                 const std::string& operation_id,
                                                 MetricsCollector* collector) {
    DocumentNavigator navigator(strategy, &timer);

    timer.start_deserialization(operation_id, collector);
    try {
        for (const auto& path : paths) {
            navigator.resolve(doc, path, operation_id);
        }
    } catch (...) {
        timer.clear(operation_id);
        throw;
    }
    timer.end_deserialization(operation_id);

    auto breakdown = timer.breakdown(operation_id);
    timer.clear(operation_id);
    return breakdown;
}

} // namespace docbench
