#pragma once
#include <algorithm>
#include <array>
#include <functional>
#include <string>
#include <vector>

// State shared by every screen of the browser: the verb to hand off with and the
// active rule kinds. Screens hold a reference and subscribe to changes.
class Session {
public:
    static constexpr std::array<const char*, 3> VERBS{"build", "run", "test"};
    static constexpr auto DEFAULT_KIND = "genrule";

    using VerbListener = std::function<void(const std::string&)>;
    using KindsListener = std::function<void(const std::vector<std::string>&)>;

    explicit Session(std::vector<std::string> kinds, std::string verb = "build")
        : verb_(std::move(verb)), kinds_(normalize(std::move(kinds))) {}

    [[nodiscard]] const std::string& verb() const { return verb_; }
    [[nodiscard]] const std::vector<std::string>& kinds() const { return kinds_; }

    // build -> run -> test -> build. An unknown verb restarts at build.
    void cycle_verb() {
        const auto it = std::find(VERBS.begin(), VERBS.end(), verb_);
        const size_t next = it == VERBS.end() ? 0 : (static_cast<size_t>(it - VERBS.begin()) + 1) % VERBS.size();
        set_verb(VERBS[next]);
    }

    void set_verb(std::string verb) {
        if (verb == verb_) return;
        verb_ = std::move(verb);
        for (const auto& listener : verb_listeners_) listener(verb_);
    }

    // Returns true if the set actually changed (order-insensitive).
    bool set_kinds(std::vector<std::string> kinds) {
        auto normalized = normalize(std::move(kinds));
        if (normalized == kinds_) return false;
        kinds_ = std::move(normalized);
        for (const auto& listener : kinds_listeners_) listener(kinds_);
        return true;
    }

    void on_verb_change(VerbListener listener) { verb_listeners_.push_back(std::move(listener)); }
    void on_kinds_change(KindsListener listener) { kinds_listeners_.push_back(std::move(listener)); }

private:
    std::string verb_;
    std::vector<std::string> kinds_;
    std::vector<VerbListener> verb_listeners_;
    std::vector<KindsListener> kinds_listeners_;

    // sorted, unique, never empty
    static std::vector<std::string> normalize(std::vector<std::string> kinds) {
        std::erase_if(kinds, [](const std::string& k) { return k.empty(); });
        std::ranges::sort(kinds);
        const auto dup = std::ranges::unique(kinds);
        kinds.erase(dup.begin(), dup.end());
        if (kinds.empty()) kinds.emplace_back(DEFAULT_KIND);
        return kinds;
    }
};
