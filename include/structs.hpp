#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

// namespace ("//a/b") -> item names, both sorted. std::map keeps namespaces ordered.
using TargetIndex = std::map<std::string, std::vector<std::string>>;

struct RemoteEndpoint {
    std::string host;      // e.g. "user@build-host"
    std::string directory; // working directory on the remote side

    // directory falls back to the local cwd when not supplied
    static RemoteEndpoint make(std::string host, const std::optional<std::string>& directory) {
        if (directory && !directory->empty()) {
            return {std::move(host), *directory};
        }
        return {std::move(host), std::filesystem::current_path().string()};
    }
};

// Names of the external programs. Overridable from .bzlrc.
struct ToolNames {
    std::string tool = "bazel";
    std::string ssh_client = "ssh";
};

// Everything needed to run, cache and refresh one discovery.
struct DiscoveryOptions {
    std::optional<RemoteEndpoint> remote;
    std::string scope = "//...";
    std::vector<std::string> kinds{"genrule"};
    std::chrono::seconds ttl{0};
    ToolNames tools;

    // "local" or the remote host, used as the cache identity
    std::string identity() const {
        return remote ? remote->host : "local";
    }
};

// Resolved [defaults] from .bzlrc files.
struct Settings {
    std::optional<std::string> ssh;
    std::optional<std::string> ssh_dir;
    std::string scope = "//...";
    long long cache_ttl_minutes = 20160; // two weeks
    std::vector<std::string> kinds{"genrule"};
    ToolNames tools;
};
