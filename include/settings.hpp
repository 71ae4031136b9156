#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <toml++/toml.hpp>

#include "log.hpp"
#include "structs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

// .bzlrc handling. Files are TOML with a [defaults] table:
//
//   [defaults]
//   ssh = "user@build-server"
//   ssh_dir = "/home/user/my-repo"
//   scope = "//modules/..."
//   cache_ttl = 20160
//   kinds = ["genrule", "cc_binary"]
//
// ~/.bzlrc is read first, then <repo root>/.bzlrc overrides it key by key.
class SettingsFile {
public:
    static constexpr auto FILE_NAME = ".bzlrc";

    static fs::path home_dir() {
        if (const char* home = std::getenv("HOME"); home && *home) {
            return home;
        }
        return fs::current_path();
    }

    // Nearest ancestor of start (inclusive) holding a WORKSPACE / MODULE.bazel.
    static std::optional<fs::path> find_repo_root(const fs::path& start) {
        std::error_code ec;
        for (fs::path dir = fs::absolute(start, ec); !ec; dir = dir.parent_path()) {
            for (const char* marker : {"WORKSPACE", "WORKSPACE.bazel", "MODULE.bazel"}) {
                if (fs::exists(dir / marker, ec)) {
                    return dir;
                }
            }
            if (dir == dir.parent_path()) break;
        }
        return std::nullopt;
    }

    static Settings load() {
        return load(home_dir(), fs::current_path());
    }

    static Settings load(const fs::path& home, const fs::path& cwd) {
        Settings settings;
        apply_file(settings, home / FILE_NAME);
        if (const auto root = find_repo_root(cwd)) {
            const fs::path repo_rc = *root / FILE_NAME;
            std::error_code ec;
            if (!fs::equivalent(repo_rc, home / FILE_NAME, ec)) {
                apply_file(settings, repo_rc);
            }
        }
        return settings;
    }

    // Merges the [defaults] table of one file. Missing or broken files leave settings untouched.
    static bool apply_file(Settings& settings, const fs::path& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return false;
        }

        toml::table tbl;
        try {
            tbl = toml::parse_file(path.string());
        } catch (const toml::parse_error& err) {
            out::warn("Ignoring '{}': {}", path.string(), err.description());
            return false;
        }

        const auto* defaults = tbl["defaults"].as_table();
        if (!defaults) {
            return true;
        }

        if (auto v = (*defaults)["ssh"].value<std::string>(); v && !v->empty()) settings.ssh = *v;
        if (auto v = (*defaults)["ssh_dir"].value<std::string>(); v && !v->empty()) settings.ssh_dir = *v;
        if (auto v = (*defaults)["scope"].value<std::string>(); v && !v->empty()) settings.scope = *v;
        if (auto v = (*defaults)["cache_ttl"].value<int64_t>()) settings.cache_ttl_minutes = *v;
        if (auto v = (*defaults)["tool"].value<std::string>(); v && !v->empty()) settings.tools.tool = *v;
        if (auto v = (*defaults)["ssh_client"].value<std::string>(); v && !v->empty()) settings.tools.ssh_client = *v;

        // kinds may be an array or the older comma separated string
        std::vector<std::string> kinds;
        if (const auto* arr = (*defaults)["kinds"].as_array()) {
            for (const auto& elem : *arr) {
                if (auto k = elem.value<std::string>()) {
                    if (const auto trimmed = Strings::trim(*k); !trimmed.empty()) kinds.emplace_back(trimmed);
                }
            }
        } else if (auto s = (*defaults)["kinds"].value<std::string>()) {
            kinds = Strings::split_list(*s);
        }
        if (!kinds.empty()) {
            settings.kinds = std::move(kinds);
        }
        return true;
    }

    // The repo's .bzlrc if there is one, else ~/.bzlrc.
    static fs::path save_path(const fs::path& home, const fs::path& cwd) {
        if (const auto root = find_repo_root(cwd)) {
            const fs::path repo_rc = *root / FILE_NAME;
            std::error_code ec;
            if (fs::exists(repo_rc, ec)) {
                return repo_rc;
            }
        }
        return home / FILE_NAME;
    }

    static bool save_kinds(const std::vector<std::string>& kinds) {
        return save_kinds(kinds, home_dir(), fs::current_path());
    }

    // Rewrites defaults.kinds, keeping every other key. Failures are logged to file only.
    static bool save_kinds(const std::vector<std::string>& kinds, const fs::path& home, const fs::path& cwd) {
        const fs::path path = save_path(home, cwd);

        toml::table tbl;
        std::error_code ec;
        if (fs::exists(path, ec)) {
            try {
                tbl = toml::parse_file(path.string());
            } catch (const toml::parse_error& err) {
                out::debug("Not saving kinds, '{}' does not parse: {}", path.string(), err.description());
                return false;
            }
        }

        if (!tbl["defaults"].as_table()) {
            tbl.insert_or_assign("defaults", toml::table{});
        }

        auto kinds_arr = toml::array{};
        for (const auto& k : kinds) {
            kinds_arr.push_back(k);
        }
        tbl["defaults"].as_table()->insert_or_assign("kinds", std::move(kinds_arr));

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            out::debug("Failed to open '{}' for writing settings.", path.string());
            return false;
        }
        file << tbl << "\n";
        if (!file.good()) {
            out::debug("Failed to write settings to '{}'.", path.string());
            return false;
        }
        out::debug("Saved kinds to '{}'.", path.string());
        return true;
    }
};
