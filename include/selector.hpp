#pragma once
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "utils.hpp"

// Filter text + filtered view + cursor over a list of display strings.
// Filtering is a case-insensitive substring AND over whitespace-separated tokens.
// No I/O, single-threaded: owned by one screen.
class FuzzySelector {
public:
    struct Row {
        size_t index;   // position in the filtered view
        std::string item;
        bool selected;
    };

    FuzzySelector() = default;

    explicit FuzzySelector(std::vector<std::string> items) {
        set_source(std::move(items));
    }

    // True if every token occurs in item (tokens are expected to be lowercase).
    static bool matches(const std::string& item, const std::vector<std::string>& tokens) {
        if (tokens.empty()) return true;
        const std::string lowered = Strings::to_lower(item);
        return std::ranges::all_of(tokens, [&](const std::string& t) {
            return lowered.find(t) != std::string::npos;
        });
    }

    static std::vector<std::string> filter(const std::string& query, const std::vector<std::string>& items) {
        const auto tokens = Strings::split_whitespace(Strings::to_lower(query));
        if (tokens.empty()) return items;

        std::vector<std::string> result;
        for (const auto& item : items) {
            if (matches(item, tokens)) result.push_back(item);
        }
        return result;
    }

    void set_filter(std::string text) {
        filter_text_ = std::move(text);
        apply_filter();
        cursor_ = 0;
    }

    void set_source(std::vector<std::string> items) {
        source_ = std::move(items);
        apply_filter();
        cursor_ = 0;
    }

    void move_up() {
        if (cursor_ > 0) --cursor_;
    }

    void move_down() {
        if (cursor_ + 1 < filtered_.size()) ++cursor_;
    }

    [[nodiscard]] std::optional<std::string> selected() const {
        if (filtered_.empty() || cursor_ >= filtered_.size()) {
            return std::nullopt;
        }
        return source_[filtered_[cursor_]];
    }

    // Window of at most `height` rows around the cursor, centered when there's room.
    // start = cursor - height/2, clamped to [0, size - height].
    [[nodiscard]] std::vector<Row> viewport(const int height) const {
        std::vector<Row> rows;
        if (height <= 0 || filtered_.empty()) {
            return rows;
        }

        const size_t h = static_cast<size_t>(height);
        const size_t half = h / 2;
        size_t start = cursor_ > half ? cursor_ - half : 0;
        const size_t end = std::min(filtered_.size(), start + h);
        if (end - start < h) {
            start = end > h ? end - h : 0;
        }

        rows.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            rows.push_back({i, source_[filtered_[i]], i == cursor_});
        }
        return rows;
    }

    [[nodiscard]] std::vector<std::string> filtered() const {
        std::vector<std::string> items;
        items.reserve(filtered_.size());
        for (const size_t i : filtered_) items.push_back(source_[i]);
        return items;
    }

    [[nodiscard]] size_t cursor() const { return cursor_; }
    [[nodiscard]] size_t count() const { return filtered_.size(); }
    [[nodiscard]] size_t total_count() const { return source_.size(); }
    [[nodiscard]] const std::string& filter_text() const { return filter_text_; }
    [[nodiscard]] const std::vector<std::string>& source() const { return source_; }

private:
    std::vector<std::string> source_;
    std::string filter_text_;
    std::vector<size_t> filtered_; // indices into source_
    size_t cursor_ = 0;

    void apply_filter() {
        filtered_.clear();
        const auto tokens = Strings::split_whitespace(Strings::to_lower(filter_text_));
        for (size_t i = 0; i < source_.size(); ++i) {
            if (matches(source_[i], tokens)) filtered_.push_back(i);
        }
    }
};
