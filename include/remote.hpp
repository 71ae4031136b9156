#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "structs.hpp"
#include "utils.hpp"

// Builds argv for bazel, either directly or wrapped in `ssh host 'cd dir && ...'`.
// Pure construction; running the result is the caller's business.
class RemoteCommandBuilder {
public:
    RemoteCommandBuilder(ToolNames tools, std::optional<RemoteEndpoint> remote)
        : tools_(std::move(tools)), remote_(std::move(remote)) {}

    explicit RemoteCommandBuilder(const DiscoveryOptions& options)
        : RemoteCommandBuilder(options.tools, options.remote) {}

    // "genrule" or "genrule|cc_binary|..."
    static std::string kind_expression(const std::vector<std::string>& kinds) {
        if (kinds.empty()) {
            throw std::invalid_argument("At least one rule kind is required");
        }
        if (kinds.size() == 1) {
            return kinds.front();
        }
        return fmt::format("{}", fmt::join(kinds, "|"));
    }

    static std::string query_expression(const std::string& scope, const std::vector<std::string>& kinds) {
        return fmt::format("kind('{}', {})", kind_expression(kinds), scope);
    }

    [[nodiscard]] std::vector<std::string> query_args(const std::string& scope, const std::vector<std::string>& kinds) const {
        const std::string expr = query_expression(scope, kinds);
        if (!remote_) {
            return {tools_.tool, "query", expr};
        }
        return {tools_.ssh_client, remote_->host,
                fmt::format("{} && {} query \"{}\"", cd_prefix(), tools_.tool, expr)};
    }

    // `query <scope> --output label_kind` yields "<kind> rule <label>" per line.
    [[nodiscard]] std::vector<std::string> all_kinds_args(const std::string& scope) const {
        if (!remote_) {
            return {tools_.tool, "query", scope, "--output", "label_kind"};
        }
        return {tools_.ssh_client, remote_->host,
                fmt::format("{} && {} query {} --output label_kind", cd_prefix(), tools_.tool, Strings::shell_quote(scope))};
    }

    // Hand-off argv. The remote variant forces a tty (-t) so bazel's progress output and prompts work.
    [[nodiscard]] std::vector<std::string> exec_args(const std::string& verb, const std::optional<std::string>& item = std::nullopt) const {
        if (!remote_) {
            std::vector<std::string> args{tools_.tool};
            for (auto& word : Strings::split_whitespace(verb)) {
                args.push_back(std::move(word));
            }
            if (item) args.push_back(*item);
            return args;
        }
        std::string remote_cmd = fmt::format("{} && {} {}", cd_prefix(), tools_.tool, verb);
        if (item) {
            remote_cmd += " " + *item;
        }
        return {tools_.ssh_client, "-t", remote_->host, std::move(remote_cmd)};
    }

    [[nodiscard]] bool is_remote() const { return remote_.has_value(); }
    [[nodiscard]] const std::optional<RemoteEndpoint>& remote() const { return remote_; }

private:
    ToolNames tools_;
    std::optional<RemoteEndpoint> remote_;

    std::string cd_prefix() const {
        return "cd " + Strings::shell_quote(remote_->directory);
    }
};
