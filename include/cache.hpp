#pragma once
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <xxhash.h>

#include "log.hpp"
#include "structs.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

struct CacheEntry {
    TargetIndex targets;
    double timestamp = 0; // epoch seconds at capture

    // "42s ago", "3m ago", "2h 5m ago", "4d ago", "1w 2d ago"
    static std::string age_str(const long long seconds) {
        const long long s = std::max(0LL, seconds);
        if (s < 60) return fmt::format("{}s ago", s);
        if (s < 3600) return fmt::format("{}m ago", s / 60);
        if (s < 86400) return fmt::format("{}h {}m ago", s / 3600, (s % 3600) / 60);
        const long long days = s / 86400;
        if (days < 7) return fmt::format("{}d ago", days);
        return fmt::format("{}w {}d ago", days / 7, days % 7);
    }
};

// One JSON file per (identity, scope, kinds) under a single cache root.
// Read failures are misses, write failures are logged to file and ignored.
class DiscoveryCache {
public:
    static constexpr int CACHE_VERSION = 1;
    static constexpr auto CACHE_FILE_EXTENSION = ".json";

    using Clock = std::function<double()>;

    explicit DiscoveryCache(fs::path root = default_root(), Clock clock = system_now)
        : root_(std::move(root)), clock_(std::move(clock)) {}

    // $XDG_CACHE_HOME/bzl, falling back to ~/.cache/bzl
    static fs::path default_root() {
        if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
            return fs::path(xdg) / "bzl";
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return fs::path(home) / ".cache" / "bzl";
        }
        return fs::temp_directory_path() / "bzl-cache";
    }

    static double system_now() {
        using namespace std::chrono;
        return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
    }

    // XXH64 over "<identity|local>:<scope>:<sorted,joined kinds>", 16 hex chars.
    static std::string cache_key(const std::string& identity, const std::string& scope, std::vector<std::string> kinds) {
        std::ranges::sort(kinds);
        const std::string raw = fmt::format("{}:{}:{}", identity.empty() ? "local" : identity, scope, fmt::join(kinds, ","));
        const XXH64_hash_t hash_val = XXH64(raw.data(), raw.size(), 0);
        return fmt::format("{:016x}", hash_val);
    }

    [[nodiscard]] fs::path path_for(const std::string& identity, const std::string& scope, const std::vector<std::string>& kinds) const {
        return root_ / (cache_key(identity, scope, kinds) + CACHE_FILE_EXTENSION);
    }

    [[nodiscard]] std::optional<CacheEntry> read(const std::string& identity, const std::string& scope,
                                                 const std::vector<std::string>& kinds, const std::chrono::seconds ttl) const {
        if (ttl.count() <= 0) {
            return std::nullopt;
        }

        const fs::path path = path_for(identity, scope, kinds);
        std::error_code ec;
        if (!fs::exists(path, ec) || ec) {
            return std::nullopt;
        }

        std::ifstream f(path);
        if (!f.is_open()) {
            return std::nullopt;
        }

        const json data = json::parse(f, nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            out::debug("Cache file '{}' is corrupt, ignoring it.", path.string());
            return std::nullopt;
        }

        try {
            if (!data.contains("version") || data.at("version").get<int>() != CACHE_VERSION) {
                out::debug("Cache file '{}' has a different format version, ignoring it.", path.string());
                return std::nullopt;
            }

            CacheEntry entry;
            entry.timestamp = data.at("timestamp").get<double>();

            const double age = clock_() - entry.timestamp;
            if (age > static_cast<double>(ttl.count())) {
                return std::nullopt;
            }

            for (const auto& [ns, items] : data.at("targets").items()) {
                auto names = items.get<std::vector<std::string>>();
                std::erase_if(names, [](const std::string& n) { return n.empty(); });
                if (ns.empty() || names.empty()) continue;
                entry.targets.emplace(ns, std::move(names));
            }
            return entry;
        } catch (const json::exception& e) {
            out::debug("Cache file '{}' is unreadable: {}", path.string(), e.what());
            return std::nullopt;
        }
    }

    [[nodiscard]] std::optional<CacheEntry> read(const DiscoveryOptions& options) const {
        return read(options.identity(), options.scope, options.kinds, options.ttl);
    }

    // Returns false when the record couldn't be stored. Callers may ignore that.
    bool write(const std::string& identity, const std::string& scope,
               const std::vector<std::string>& kinds, const TargetIndex& targets) const {
        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) {
            out::debug("Could not create cache directory '{}': {}", root_.string(), ec.message());
            return false;
        }

        std::string serialized;
        try {
            const json record = {
                {"version", CACHE_VERSION},
                {"host", identity.empty() ? "local" : identity},
                {"scope", scope},
                {"kinds", kinds},
                {"timestamp", clock_()},
                {"targets", targets},
            };
            serialized = record.dump(2);
        } catch (const json::exception& e) {
            // labels that aren't valid UTF-8 can't be stored; they would come back altered
            out::debug("Not caching results for {}: {}", scope, e.what());
            return false;
        }

        const fs::path path = path_for(identity, scope, kinds);
        const fs::path tmp_path = fs::path(path).concat(fmt::format(".tmp.{}", getpid()));
        {
            std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
            if (!f.is_open()) {
                out::debug("Could not open '{}' for writing.", tmp_path.string());
                return false;
            }
            f << serialized;
            if (!f.good()) {
                out::debug("Failed writing cache record '{}'.", tmp_path.string());
                f.close();
                fs::remove(tmp_path, ec);
                return false;
            }
        }

        // rename is atomic, so a concurrent reader sees either the old or the new record
        fs::rename(tmp_path, path, ec);
        if (ec) {
            out::debug("Could not move cache record into place '{}': {}", path.string(), ec.message());
            fs::remove(tmp_path, ec);
            return false;
        }
        return true;
    }

    bool write(const DiscoveryOptions& options, const TargetIndex& targets) const {
        return write(options.identity(), options.scope, options.kinds, targets);
    }

    void invalidate(const std::string& identity, const std::string& scope, const std::vector<std::string>& kinds) const {
        std::error_code ec;
        fs::remove(path_for(identity, scope, kinds), ec);
        if (ec) {
            out::debug("Could not remove cache record: {}", ec.message());
        }
    }

    void invalidate(const DiscoveryOptions& options) const {
        invalidate(options.identity(), options.scope, options.kinds);
    }

    [[nodiscard]] double now() const { return clock_(); }
    [[nodiscard]] const fs::path& root() const { return root_; }

private:
    fs::path root_;
    Clock clock_;
};
