#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "cache.hpp"
#include "log.hpp"
#include "parser.hpp"
#include "remote.hpp"
#include "structs.hpp"
#include "utils.hpp"

// The two failures a user ever sees. Everything else degrades to a cache miss.
class DiscoveryError : public std::runtime_error {
public:
    enum class Kind { ProcessFailure, EmptyResult };

    DiscoveryError(const Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const { return kind_; }

    // Suggests where to look when the remote working directory doesn't exist.
    [[nodiscard]] std::optional<std::string> hint(const std::optional<RemoteEndpoint>& remote) const {
        if (kind_ != Kind::ProcessFailure || !remote) {
            return std::nullopt;
        }
        if (std::string_view(what()).find("No such file or directory") == std::string_view::npos) {
            return std::nullopt;
        }
        return fmt::format(
            "The remote dir '{0}' doesn't exist on {1}.\n"
            "    Find the right path with:\n"
            "      ssh {1} \"find ~ -maxdepth 4 -name WORKSPACE -o -name MODULE.bazel 2>/dev/null\"\n"
            "    Then re-run:\n"
            "      bzl --ssh {1} --ssh-dir /path/on/remote\n"
            "    Or set it permanently in .bzlrc:\n"
            "      [defaults]\n"
            "      ssh = \"{1}\"\n"
            "      ssh_dir = \"/path/on/remote\"",
            remote->directory, remote->host);
    }

private:
    Kind kind_;
};

// Cache + command builder + parser behind one call. Copyable, so a copy can be
// handed to a background job.
class Discovery {
public:
    using Runner = std::function<CommandResult(const std::vector<std::string>&)>;

    struct Loaded {
        TargetIndex targets;
        std::optional<double> cached_at; // set when served from the cache
    };

    explicit Discovery(DiscoveryCache cache, Runner runner = &Execution::execute_vec)
        : cache_(std::move(cache)), runner_(std::move(runner)) {}

    // Cache first, bazel on a miss.
    Loaded load(const DiscoveryOptions& options) const {
        if (auto entry = cache_.read(options)) {
            out::debug("Cache hit for {} {} [{}]", options.identity(), options.scope, fmt::join(options.kinds, ","));
            return {std::move(entry->targets), entry->timestamp};
        }
        return {query(options), std::nullopt};
    }

    // Runs the query, parses, stores. Throws DiscoveryError.
    TargetIndex query(const DiscoveryOptions& options) const {
        const RemoteCommandBuilder builder(options);
        const auto args = builder.query_args(options.scope, options.kinds);
        out::debug("Running: {}", Strings::display_command(args));

        const auto result = runner_(args);
        if (result.exit_code != 0) {
            const auto err = Strings::trim(result.stderr_output);
            std::string message = err.empty()
                ? std::string(builder.is_remote() ? "remote bazel query failed" : "bazel query failed")
                : std::string(err);
            throw DiscoveryError(DiscoveryError::Kind::ProcessFailure, message);
        }

        TargetIndex targets = OutputParser::parse(result.stdout_output);
        if (targets.empty()) {
            throw DiscoveryError(DiscoveryError::Kind::EmptyResult, "No targets found.");
        }

        cache_.write(options, targets);
        return targets;
    }

    // Forced refresh: drop the record, then query.
    TargetIndex refresh(const DiscoveryOptions& options) const {
        cache_.invalidate(options);
        return query(options);
    }

    // Kinds available in the scope. A failed query yields an empty list.
    std::vector<std::string> enumerate_kinds(const DiscoveryOptions& options) const {
        const RemoteCommandBuilder builder(options);
        const auto args = builder.all_kinds_args(options.scope);
        out::debug("Running: {}", Strings::display_command(args));

        const auto result = runner_(args);
        if (result.exit_code != 0) {
            out::debug("Kind enumeration failed ({}): {}", result.exit_code, Strings::trim(result.stderr_output));
            return {};
        }
        return OutputParser::parse_kinds(result.stdout_output);
    }

    [[nodiscard]] const DiscoveryCache& cache() const { return cache_; }

private:
    DiscoveryCache cache_;
    Runner runner_;
};
