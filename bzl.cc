// BZL - browse bazel targets (locally or over ssh), pick one, and run it
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "log.hpp"
#include "utils.hpp"
#include "structs.hpp"
#include "remote.hpp"
#include "cache.hpp"
#include "parser.hpp"
#include "selector.hpp"
#include "discovery.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "arguments.hpp"
#include "worker.hpp"

#ifdef USE_TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
using namespace ftxui;
#endif

#define DATE __DATE__
#define TIME __TIME__
#define VERSION "0.3.0"

namespace fs = std::filesystem;

static constexpr auto LOG_FILE_NAME = "bzl.log";

// The command the user picked in the browser
struct Handoff {
    std::optional<std::string> item; // "//pkg:rule", absent for clean/expunge
    std::string verb;
};

#ifdef USE_TUI
class Browser {
public:
    Browser(TargetIndex targets, Session& session, Discovery discovery, DiscoveryOptions options)
        : targets_(std::move(targets)), session_(session),
          discovery_(std::move(discovery)), options_(std::move(options)) {
        options_.kinds = session_.kinds();
        modules_.set_source(module_names());
        session_.on_kinds_change([this](const std::vector<std::string>& kinds) {
            options_.kinds = kinds;
        });
    }

    // Runs the UI until the user quits (nullopt) or picks something to execute.
    std::optional<Handoff> run() {
        auto screen = ScreenInteractive::Fullscreen();
        screen.ForceHandleCtrlC(false);

        // Workers may finish after the screen is gone; they only wake it while it's alive.
        const auto wake_target = std::make_shared<WakeTarget>();
        wake_target->screen = &screen;
        wake_ = [wake_target] {
            std::lock_guard lock(wake_target->mutex);
            if (wake_target->screen) wake_target->screen->PostEvent(Event::Custom);
        };
        exit_ = screen.ExitLoopClosure();

        auto renderer = Renderer([&] {
            poll();
            return render(screen.dimy());
        });

        auto controller = CatchEvent(renderer, [&](const Event& event) {
            if (event == CtrlC) {
                interrupted_ = true;
                result_.reset();
                exit_();
                return true;
            }
            if (event == Event::Custom) {
                poll();
                return true;
            }
            if (kind_dialog_open_) {
                return handle_kind_event(event);
            }
            return handle_list_event(event);
        });

        screen.Loop(controller);

        {
            std::lock_guard lock(wake_target->mutex);
            wake_target->screen = nullptr;
        }
        return result_;
    }

    [[nodiscard]] bool interrupted() const { return interrupted_; }

private:
    enum class Page { Modules, Targets };

    struct RefreshOutcome {
        std::optional<TargetIndex> targets;
        std::string error;
        std::vector<std::string> kinds; // the kinds the query ran with
    };

    struct WakeTarget {
        std::mutex mutex;
        ScreenInteractive* screen = nullptr;
    };

    // header, shortcuts, breadcrumb, two separators, status, filter bar, border
    static constexpr int CHROME_ROWS = 9;

    inline static const Event CtrlC = Event::Special("\x03");
    inline static const Event CtrlE = Event::Special("\x05");
    inline static const Event CtrlF = Event::Special("\x06");
    inline static const Event CtrlK = Event::Special("\x0b");
    inline static const Event CtrlV = Event::Special("\x16");
    inline static const Event CtrlX = Event::Special("\x18");

    TargetIndex targets_;
    Session& session_;
    Discovery discovery_;
    DiscoveryOptions options_;

    FuzzySelector modules_;
    FuzzySelector rules_;
    FuzzySelector kinds_;
    Page page_ = Page::Modules;
    std::string module_;

    bool kind_dialog_open_ = false;
    bool kinds_loading_ = false;
    std::set<std::string> kind_checked_;

    std::string status_;
    BackgroundWorker<RefreshOutcome> refresh_worker_;
    BackgroundWorker<std::vector<std::string>> kinds_worker_;

    std::function<void()> wake_;
    std::function<void()> exit_;
    std::optional<Handoff> result_;
    bool interrupted_ = false;

    std::vector<std::string> module_names() const {
        std::vector<std::string> names;
        names.reserve(targets_.size());
        for (const auto& ns : targets_ | std::views::keys) names.push_back(ns);
        return names;
    }

    std::vector<std::string> rules_of(const std::string& module) const {
        if (const auto it = targets_.find(module); it != targets_.end()) return it->second;
        return {};
    }

    FuzzySelector& active() {
        return page_ == Page::Modules ? modules_ : rules_;
    }

    std::string refresh_key() const {
        return options_.identity() + ":" + options_.scope;
    }

    // --- background work ---

    void request_refresh() {
        const Discovery discovery = discovery_;
        const DiscoveryOptions opts = options_;
        const bool started = refresh_worker_.request(refresh_key(), [discovery, opts]() -> RefreshOutcome {
            try {
                return {discovery.refresh(opts), "", opts.kinds};
            } catch (const DiscoveryError& e) {
                return {std::nullopt, e.what(), opts.kinds};
            }
        }, wake_);

        status_ = started ? "Refreshing..." : "A refresh is already running";
    }

    void request_kinds() {
        const Discovery discovery = discovery_;
        const DiscoveryOptions opts = options_;
        kinds_worker_.request("kinds:" + refresh_key(), [discovery, opts] {
            return discovery.enumerate_kinds(opts);
        }, wake_);
    }

    // The single place where background results touch UI state.
    void poll() {
        try {
            refresh_worker_.drain([this](const std::string&, RefreshOutcome outcome) {
                apply_refresh(std::move(outcome));
            });
        } catch (const std::exception& e) {
            status_ = fmt::format("Refresh failed: {}", e.what());
            out::debug("Refresh failed: {}", e.what());
        }

        try {
            kinds_worker_.drain([this](const std::string&, std::vector<std::string> kinds) {
                apply_kinds(std::move(kinds));
            });
        } catch (const std::exception& e) {
            out::debug("Kind enumeration failed: {}", e.what());
            apply_kinds({});
        }
    }

    void apply_refresh(RefreshOutcome outcome) {
        if (outcome.kinds != session_.kinds()) {
            // kinds changed while this one ran
            request_refresh();
            return;
        }
        if (!outcome.targets) {
            status_ = outcome.error;
            out::debug("Refresh failed, keeping previous results: {}", outcome.error);
            return;
        }

        targets_ = std::move(*outcome.targets);
        modules_.set_filter("");
        modules_.set_source(module_names());
        if (page_ == Page::Targets) {
            rules_.set_filter("");
            rules_.set_source(rules_of(module_));
        }
        status_ = fmt::format("Refreshed: {} targets in {} packages",
                              OutputParser::count_items(targets_), targets_.size());
    }

    void apply_kinds(std::vector<std::string> found) {
        if (!kind_dialog_open_) return;

        std::set<std::string> all(found.begin(), found.end());
        all.insert(session_.kinds().begin(), session_.kinds().end());
        kinds_.set_source({all.begin(), all.end()});
        kinds_loading_ = false;
    }

    void finish(Handoff handoff) {
        result_ = std::move(handoff);
        exit_();
    }

    // --- events ---

    bool handle_filter_keys(FuzzySelector& selector, const Event& event) {
        if (event == Event::ArrowUp) {
            selector.move_up();
            return true;
        }
        if (event == Event::ArrowDown) {
            selector.move_down();
            return true;
        }
        if (event == Event::Backspace) {
            std::string text = selector.filter_text();
            if (!text.empty()) {
                // drop a whole UTF-8 sequence
                size_t cut = text.size() - 1;
                while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
                text.resize(cut);
                selector.set_filter(std::move(text));
            }
            return true;
        }
        if (event.is_character()) {
            selector.set_filter(selector.filter_text() + event.character());
            return true;
        }
        return false;
    }

    bool handle_list_event(const Event& event) {
        if (event == CtrlV) {
            session_.cycle_verb();
            return true;
        }
        if (event == CtrlE) {
            finish({std::nullopt, "clean"});
            return true;
        }
        if (event == CtrlX) {
            finish({std::nullopt, "clean --expunge"});
            return true;
        }
        if (event == CtrlF) {
            request_refresh();
            return true;
        }
        if (event == CtrlK) {
            open_kind_dialog();
            return true;
        }
        if (event == Event::Escape) {
            if (page_ == Page::Targets) {
                page_ = Page::Modules;
            } else {
                result_.reset();
                exit_();
            }
            return true;
        }
        if (event == Event::Return) {
            if (page_ == Page::Modules) {
                if (const auto module = modules_.selected()) {
                    module_ = *module;
                    rules_ = FuzzySelector(rules_of(module_));
                    page_ = Page::Targets;
                }
            } else if (const auto rule = rules_.selected()) {
                finish({fmt::format("{}:{}", module_, *rule), session_.verb()});
            }
            return true;
        }
        return handle_filter_keys(active(), event);
    }

    void open_kind_dialog() {
        kind_dialog_open_ = true;
        kinds_loading_ = true;
        kind_checked_ = {session_.kinds().begin(), session_.kinds().end()};
        kinds_ = FuzzySelector();
        request_kinds();
    }

    bool handle_kind_event(const Event& event) {
        if (event == Event::Escape) {
            kind_dialog_open_ = false;
            return true;
        }
        if (kinds_loading_) {
            return true;
        }
        if (event == Event::Character(' ')) {
            if (const auto kind = kinds_.selected()) {
                if (!kind_checked_.erase(*kind)) kind_checked_.insert(*kind);
            }
            return true;
        }
        if (event == Event::Return) {
            kind_dialog_open_ = false;
            if (session_.set_kinds({kind_checked_.begin(), kind_checked_.end()})) {
                request_refresh();
            }
            return true;
        }
        return handle_filter_keys(kinds_, event);
    }

    // --- rendering ---

    Element render_header() const {
        Element context = options_.remote
            ? text(" SSH: " + options_.remote->host + " ") | bold | color(Color::White) | bgcolor(Color::DarkOrange)
            : text(" " + options_.scope + " ") | bold | color(Color::White) | bgcolor(Color::Cyan);

        Color verb_color = Color::DeepSkyBlue1;
        if (session_.verb() == "build") verb_color = Color::Green;
        else if (session_.verb() == "test") verb_color = Color::Magenta;

        Elements items{
            text(" bzl ") | bold | color(Color::Cyan),
            context,
            text(" "),
            text(" " + Strings::to_lower(session_.verb()) + " ") | bold | color(Color::White) | bgcolor(verb_color),
            filler(),
        };
        if (refresh_worker_.busy()) {
            items.push_back(text(" loading... ") | dim);
        }
        items.push_back(text(fmt::format(" kinds: {} ", fmt::join(session_.kinds(), ","))) | dim);
        return hbox(std::move(items));
    }

    Element render_shortcuts() const {
        const std::vector<std::pair<std::string, std::string>> shortcuts{
            {"<enter>", page_ == Page::Modules ? "select" : "execute"},
            {"<ctrl+v>", "toggle cmd"}, {"<ctrl+e>", "clean"}, {"<ctrl+x>", "expunge"},
            {"<ctrl+f>", "refresh"}, {"<ctrl+k>", "config"},
            {"<esc>", page_ == Page::Modules ? "quit" : "back"},
        };
        Elements parts;
        for (const auto& [key, what] : shortcuts) {
            parts.push_back(text(fmt::format("{:<9}", key)) | dim);
            parts.push_back(text(fmt::format("{:<12}", what)));
        }
        return hbox(std::move(parts));
    }

    Element render_breadcrumb() const {
        if (page_ == Page::Modules) {
            return hbox({
                text("Modules  ") | dim,
                text(std::to_string(modules_.count())) | bold,
                text(fmt::format("/{}", modules_.total_count())) | dim,
            });
        }
        return hbox({
            text("Modules > ") | dim,
            text(module_) | bold | color(Color::Cyan),
            text("  "),
            text(std::to_string(rules_.count())) | bold,
            text(fmt::format("/{} targets", rules_.total_count())) | dim,
        });
    }

    Element render_row(const FuzzySelector::Row& row) const {
        const std::string marker = row.selected ? " > " : "   ";
        Element line;
        if (page_ == Page::Modules) {
            const size_t count = rules_of(row.item).size();
            line = hbox({
                text(marker + row.item),
                filler(),
                text(fmt::format("{} {} ", count, count == 1 ? "target" : "targets")) | dim,
            });
        } else {
            line = text(marker + row.item);
        }
        if (row.selected) {
            line = line | bold | color(Color::Cyan) | bgcolor(Color::NavyBlue);
        }
        return line;
    }

    Element render_list(const FuzzySelector& selector, const int rows) const {
        if (selector.count() == 0) {
            return text("  (no matches)") | dim;
        }
        Elements lines;
        for (const auto& row : selector.viewport(rows)) {
            lines.push_back(render_row(row));
        }
        return vbox(std::move(lines));
    }

    Element render_kind_dialog() const {
        Element body;
        if (kinds_loading_) {
            body = text("Refreshing bazel filters...") | dim | center;
        } else if (kinds_.count() == 0) {
            body = text("  (no matches)") | dim;
        } else {
            Elements lines;
            for (const auto& row : kinds_.viewport(15)) {
                const std::string box = kind_checked_.contains(row.item) ? "[x] " : "[ ] ";
                auto line = text((row.selected ? " > " : "   ") + box + row.item);
                if (row.selected) line = line | bold | color(Color::Cyan);
                lines.push_back(line);
            }
            body = vbox(std::move(lines));
        }

        return window(text(" Select Rule Kinds ") | bold | center, vbox({
                   text("<space> toggle  <enter> apply  <esc> cancel") | dim | center,
                   text("Filter: " + kinds_.filter_text()) | dim,
                   separator(),
                   body | flex,
               })) |
               size(WIDTH, EQUAL, 65) | size(HEIGHT, LESS_THAN, 25) | clear_under | center;
    }

    Element render(const int screen_rows) const {
        const int rows = std::max(1, screen_rows - CHROME_ROWS);
        const FuzzySelector& selector = page_ == Page::Modules ? modules_ : rules_;

        Elements layout{
            render_header(),
            render_shortcuts(),
            render_breadcrumb(),
            separator(),
            render_list(selector, rows) | flex,
            separator(),
            text(status_) | dim,
            hbox({text("Filter: ") | dim, text("> ") | bold, text(selector.filter_text()), text("_") | blink}),
        };
        Element main = vbox(std::move(layout)) | border;

        if (kind_dialog_open_) {
            return dbox({main, render_kind_dialog()});
        }
        return main;
    }
};
#endif

class Information {
public:
    static void show_version() {
        fmt::print("bzl {} compiled on {} at {}\n",
            fmt::styled(VERSION, COLOR_SUCCESS),
            fmt::styled(DATE, COLOR_INFO),
            fmt::styled(TIME, COLOR_INFO)
        );
    }

    static void show_help() {
        using fmt::styled;
        show_version();

        fmt::print(
            "\n"
            "Usage: bzl [command] [options]\n\n"
            "Commands:\n"
            "  {}     Browse targets interactively and run the chosen one.\n"
            "  {}               Print every discovered target as 'package:rule'.\n"
            "  {}              List the rule kinds available in the scope.\n"
            "  {}        Drop the cached results for the current host/scope/kinds.\n"
            "  {}            Show current version and build date.\n"
            "  {}               Show this help message.\n"
            "Options:\n"
            "  {}    Run query and build on a remote host over SSH.\n"
            "  {}      Working directory on the remote host (default: local cwd).\n"
            "  {}    Bazel query scope (default: //...).\n"
            "  {}  Cache TTL in minutes (default: 20160). 0 disables the cache.\n"
            "  {}          Bypass the cache and force a fresh query.\n"
            "  {}     Comma separated rule kinds to query (default: genrule).\n"
            "\n"
            "Defaults can be set in ~/.bzlrc or <repo>/.bzlrc (TOML, values quoted):\n"
            "  [defaults]\n"
            "  ssh = \"user@build-server\"\n"
            "  ssh_dir = \"/home/user/my-repo\"\n"
            "  scope = \"//modules/...\"\n"
            "  cache_ttl = 20160\n",
            styled("<none> or browse", COLOR_PROMPT),
            styled("list", COLOR_PROMPT),
            styled("kinds", COLOR_PROMPT),
            styled("clear-cache", COLOR_PROMPT),
            styled("version", COLOR_PROMPT),
            styled("help", COLOR_PROMPT),
            styled("-s, --ssh USER@HOST", COLOR_PROMPT),
            styled("-d, --ssh-dir PATH", COLOR_PROMPT),
            styled("-S, --scope PATTERN", COLOR_PROMPT),
            styled("-c, --cache-ttl MINUTES", COLOR_PROMPT),
            styled("-n, --no-cache", COLOR_PROMPT),
            styled("-k, --kinds K1,K2", COLOR_PROMPT)
        );
    }
};

class CLIHandler {
public:
    CLIHandler();
    int handle_command(int argc, char* argv[]) const;

private:
    struct Command {
        std::string description;
        std::function<int(const Arguments&)> handler;
    };

    std::unordered_map<std::string, Command> commands_;

    int handle_browse(const Arguments& args) const;
    static int handle_list(const Arguments& args);
    static int handle_kinds(const Arguments& args);
    static int handle_clear_cache(const Arguments& args);
    static int handle_help(const Arguments& args);
    static int handle_version(const Arguments& args);

    static std::optional<TargetIndex> load_targets(const Discovery& discovery, const DiscoveryOptions& options);
    static void report_failure(const DiscoveryError& e, const DiscoveryOptions& options);
    static void warn_missing_ssh_dir(const Arguments& args);
    static int hand_off(const DiscoveryOptions& options, const Handoff& handoff);
    void register_commands();
};

CLIHandler::CLIHandler() {
    register_commands();
}

void CLIHandler::register_commands() {
    commands_["browse"] = {"Browse targets and run the chosen one",
        [this](const auto& args) { return handle_browse(args); }};
    commands_["list"] = {"Print discovered targets",
        &CLIHandler::handle_list};
    commands_["kinds"] = {"List rule kinds in scope",
        &CLIHandler::handle_kinds};
    commands_["clear-cache"] = {"Drop cached results",
        &CLIHandler::handle_clear_cache};
    commands_["help"] = {"Show help information",
        &CLIHandler::handle_help};
    commands_["version"] = {"Show version information",
        &CLIHandler::handle_version};
}

int CLIHandler::handle_command(const int argc, char* argv[]) const {
    const std::vector<std::string> raw(argv, argv + argc);

    const auto args = Arguments::parse(raw, SettingsFile::load());
    if (!args) {
        return 1;
    }

    if (!out::init_log_file(DiscoveryCache::default_root() / LOG_FILE_NAME)) {
        // the file sink is optional
        out::debug("Running without a log file.");
    }

    const auto it = commands_.find(args->command);
    if (it == commands_.end()) {
        out::error("Unknown command {}. Use 'bzl help' for usage.", args->command);
        return 1;
    }
    return it->second.handler(*args);
}

void CLIHandler::warn_missing_ssh_dir(const Arguments& args) {
    if (args.ssh && !args.ssh_dir) {
        out::warn("No --ssh-dir set. Assuming remote dir = {}", fs::current_path().string());
        out::warn("If wrong, pass --ssh-dir /path/on/remote or add ssh_dir = \"...\" to .bzlrc");
    }
}

void CLIHandler::report_failure(const DiscoveryError& e, const DiscoveryOptions& options) {
    if (e.kind() == DiscoveryError::Kind::EmptyResult) {
        out::error("No targets found (scope: {}, kinds: {}).", options.scope, fmt::join(options.kinds, ","));
        return;
    }
    out::error("Bazel query failed: {}", e.what());
    if (const auto hint = e.hint(options.remote)) {
        out::info("Hint: {}", *hint);
    }
}

std::optional<TargetIndex> CLIHandler::load_targets(const Discovery& discovery, const DiscoveryOptions& options) {
    if (auto cached = discovery.cache().read(options)) {
        const auto age = static_cast<long long>(discovery.cache().now() - cached->timestamp);
        out::info("Using cached results ({}) - press ctrl+f inside bzl to refresh", CacheEntry::age_str(age));
        return std::move(cached->targets);
    }

    const std::string where = options.remote ? "ssh " + options.remote->host : "local";
    out::info("Querying Bazel ({}, scope: {}) ...", where, options.scope);
    try {
        return discovery.query(options);
    } catch (const DiscoveryError& e) {
        report_failure(e, options);
        return std::nullopt;
    }
}

int CLIHandler::hand_off(const DiscoveryOptions& options, const Handoff& handoff) {
    const RemoteCommandBuilder builder(options);
    const auto exec_args = builder.exec_args(handoff.verb, handoff.item);

    std::string rule;
    for (int i = 0; i < 60; ++i) rule += "─";
    fmt::print("\n$ {}\n{}\n", fmt::styled(Strings::display_command(exec_args), COLOR_CMD), rule);
    std::fflush(stdout);
    out::debug("Handing off: {}", Strings::display_command(exec_args));
    out::close_log_file();

    const std::string reason = Execution::exec_replace(exec_args);
    out::error("Failed to launch '{}': {}", exec_args.front(), reason);
    return 127;
}

int CLIHandler::handle_browse(const Arguments& args) const {
    warn_missing_ssh_dir(args);
    const DiscoveryOptions options = args.options();
    const Discovery discovery{DiscoveryCache{}};

    auto targets = load_targets(discovery, options);
    if (!targets) {
        return 1;
    }

#ifdef USE_TUI
    Session session(options.kinds);
    session.on_kinds_change([](const std::vector<std::string>& kinds) {
        if (!SettingsFile::save_kinds(kinds)) {
            out::debug("Selected kinds were not persisted.");
        }
    });

    Browser browser(std::move(*targets), session, discovery, options);
    out::set_console(false);
    const auto handoff = browser.run();
    out::set_console(true);

    if (browser.interrupted()) {
        return 130;
    }
    if (!handoff) {
        return 0;
    }

    return hand_off(options, *handoff);
#else
    out::warn("Built without the interactive browser, printing targets instead.");
    fmt::print("{}", OutputParser::serialize(*targets));
    return 0;
#endif
}

int CLIHandler::handle_list(const Arguments& args) {
    const DiscoveryOptions options = args.options();
    const Discovery discovery{DiscoveryCache{}};
    try {
        const auto loaded = discovery.load(options);
        fmt::print("{}", OutputParser::serialize(loaded.targets));
        return 0;
    } catch (const DiscoveryError& e) {
        report_failure(e, options);
        return 1;
    }
}

int CLIHandler::handle_kinds(const Arguments& args) {
    const DiscoveryOptions options = args.options();
    const Discovery discovery{DiscoveryCache{}};

    const auto kinds = discovery.enumerate_kinds(options);
    if (kinds.empty()) {
        out::error("Could not list rule kinds in scope {}.", options.scope);
        return 1;
    }

    const std::set<std::string> active(options.kinds.begin(), options.kinds.end());
    for (const auto& kind : kinds) {
        if (active.contains(kind)) {
            fmt::print("{} {}\n", fmt::styled("*", COLOR_SUCCESS), kind);
        } else {
            fmt::print("  {}\n", kind);
        }
    }
    return 0;
}

int CLIHandler::handle_clear_cache(const Arguments& args) {
    const DiscoveryOptions options = args.options();
    const DiscoveryCache cache;
    cache.invalidate(options);
    out::success("Cleared cached results for {} (scope: {}, kinds: {}).",
                 options.identity(), options.scope, fmt::join(options.kinds, ","));
    return 0;
}

int CLIHandler::handle_help(const Arguments&) {
    Information::show_help();
    return 0;
}

int CLIHandler::handle_version(const Arguments&) {
    Information::show_version();
    return 0;
}

int main(const int argc, char* argv[]) {
    const CLIHandler cli;
    return cli.handle_command(argc, argv);
}
