#pragma once
#include <algorithm>
#include <ranges>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "structs.hpp"
#include "utils.hpp"

class OutputParser {
public:
    // Turns `bazel query` stdout into {namespace: [items]}.
    // Lines look like "//services/alerts:generate_client". Anything else (blank lines,
    // comments, warnings printed to stdout) is dropped. The split is on the LAST ':'.
    static TargetIndex parse(const std::string_view raw) {
        TargetIndex index;
        for (const auto& line : Strings::split_lines(raw)) {
            const auto trimmed = Strings::trim(line);
            if (trimmed.empty() || !trimmed.starts_with("//")) {
                continue;
            }

            const auto sep = trimmed.rfind(':');
            if (sep == std::string_view::npos) {
                continue;
            }

            const auto ns = trimmed.substr(0, sep);
            const auto item = trimmed.substr(sep + 1);
            if (item.empty()) {
                continue;
            }
            index[std::string(ns)].emplace_back(item);
        }

        for (auto& items : index | std::views::values) {
            std::ranges::sort(items);
        }
        return index;
    }

    // `--output label_kind` lines are "<kind> rule <label>"; the first token is the kind.
    // Lines without a space or tab are skipped. Result is sorted and unique.
    static std::vector<std::string> parse_kinds(const std::string_view raw) {
        std::set<std::string> kinds;
        for (const auto& line : Strings::split_lines(raw)) {
            const auto space = line.find_first_of(" \t");
            if (space == std::string::npos || space == 0) {
                continue;
            }
            kinds.insert(line.substr(0, space));
        }
        return {kinds.begin(), kinds.end()};
    }

    // Inverse of parse(): one "namespace:item" line per item.
    static std::string serialize(const TargetIndex& index) {
        std::string out;
        for (const auto& [ns, items] : index) {
            for (const auto& item : items) {
                out += ns;
                out += ':';
                out += item;
                out += '\n';
            }
        }
        return out;
    }

    static size_t count_items(const TargetIndex& index) {
        size_t total = 0;
        for (const auto& items : index | std::views::values) {
            total += items.size();
        }
        return total;
    }
};
