#pragma once
#include <algorithm>
#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "log.hpp"
#include "structs.hpp"
#include "utils.hpp"

struct Arguments {
    std::string command = "browse";
    std::optional<std::string> ssh;
    std::optional<std::string> ssh_dir;
    std::string scope = "//...";
    long long cache_ttl_minutes = 20160;
    bool no_cache = false;
    std::vector<std::string> kinds{"genrule"};
    ToolNames tools;

    [[nodiscard]] std::chrono::seconds ttl() const {
        if (no_cache || cache_ttl_minutes <= 0) return std::chrono::seconds(0);
        constexpr long long max_minutes = std::chrono::seconds::max().count() / 60;
        return std::chrono::minutes(std::min(cache_ttl_minutes, max_minutes));
    }

    [[nodiscard]] DiscoveryOptions options() const {
        DiscoveryOptions opts;
        if (ssh) opts.remote = RemoteEndpoint::make(*ssh, ssh_dir);
        opts.scope = scope;
        opts.kinds = kinds;
        opts.ttl = ttl();
        opts.tools = tools;
        return opts;
    }

    static const std::unordered_set<std::string>& commands() {
        static const std::unordered_set<std::string> names{"browse", "list", "kinds", "clear-cache", "help", "version"};
        return names;
    }

    // args[0] is the program name. Defaults come from the resolved .bzlrc settings.
    // Bad input is reported and yields nullopt.
    static std::optional<Arguments> parse(const std::vector<std::string>& args, const Settings& defaults) {
        Arguments a;
        a.ssh = defaults.ssh;
        a.ssh_dir = defaults.ssh_dir;
        a.scope = defaults.scope;
        a.cache_ttl_minutes = defaults.cache_ttl_minutes;
        a.kinds = defaults.kinds;
        a.tools = defaults.tools;

        bool command_seen = false;
        for (size_t i = 1; i < args.size(); ++i) {
            std::string flag = args[i];
            std::optional<std::string> inline_value;
            if (flag.starts_with("--")) {
                if (const auto eq = flag.find('='); eq != std::string::npos) {
                    inline_value = flag.substr(eq + 1);
                    flag.resize(eq);
                }
            }

            auto take_value = [&]() -> std::optional<std::string> {
                if (inline_value) return inline_value;
                if (i + 1 >= args.size()) {
                    out::error("Option '{}' expects a value.", flag);
                    return std::nullopt;
                }
                return args[++i];
            };

            if (flag == "-h" || flag == "--help") {
                a.command = "help";
                return a;
            }
            if (flag == "-V" || flag == "--version") {
                a.command = "version";
                return a;
            }
            if (flag == "-n" || flag == "--no-cache") {
                a.no_cache = true;
                continue;
            }
            if (flag == "-s" || flag == "--ssh") {
                const auto v = take_value();
                if (!v) return std::nullopt;
                a.ssh = *v;
                continue;
            }
            if (flag == "-d" || flag == "--ssh-dir") {
                const auto v = take_value();
                if (!v) return std::nullopt;
                a.ssh_dir = *v;
                continue;
            }
            if (flag == "-S" || flag == "--scope") {
                const auto v = take_value();
                if (!v) return std::nullopt;
                if (v->empty()) {
                    out::error("Scope must not be empty.");
                    return std::nullopt;
                }
                a.scope = *v;
                continue;
            }
            if (flag == "-c" || flag == "--cache-ttl") {
                const auto v = take_value();
                if (!v) return std::nullopt;
                long long minutes = 0;
                const auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), minutes);
                if (ec != std::errc{} || ptr != v->data() + v->size()) {
                    out::error("Invalid cache TTL '{}': expected a number of minutes.", *v);
                    return std::nullopt;
                }
                a.cache_ttl_minutes = minutes;
                continue;
            }
            if (flag == "-k" || flag == "--kinds") {
                const auto v = take_value();
                if (!v) return std::nullopt;
                auto kinds = Strings::split_list(*v);
                if (kinds.empty()) {
                    out::error("At least one rule kind is required.");
                    return std::nullopt;
                }
                a.kinds = std::move(kinds);
                continue;
            }
            if (flag.starts_with("-")) {
                out::error("Unknown option '{}'. Use 'bzl help' for usage.", flag);
                return std::nullopt;
            }
            if (!command_seen && commands().contains(flag)) {
                a.command = flag;
                command_seen = true;
                continue;
            }
            out::error("Unexpected argument '{}'. Use 'bzl help' for usage.", flag);
            return std::nullopt;
        }

        return a;
    }
};
