#include "AppException.hpp"
#include "CameraSession.hpp"
#include "Logger.hpp"
#include "PathClassifier.hpp"
#include "Settings.hpp"
#include "Trash.hpp"

#include <QCoreApplication>
#include <QString>

#include <fmt/format.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>


#ifndef CAMERA_SORTER_VERSION
#define CAMERA_SORTER_VERSION "dev"
#endif

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitEntryFailed = 1;
constexpr int kExitUsage = 2;

bool initialize_loggers(const std::string& log_dir)
{
    try {
        Logger::setup_loggers(log_dir);
        return true;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

struct ParsedArguments {
    std::string root;
    std::string config_dir;
    std::string command;
    std::vector<std::string> args;
};

void print_usage()
{
    std::fprintf(stderr, "camera-sorter %s\n", CAMERA_SORTER_VERSION);
    std::fprintf(stderr,
        "Usage: camera-sorter [--root DIR] [--config-dir DIR] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  scan                         list files waiting to be organized\n"
        "  plan                         preview where each file would go\n"
        "  apply                        move every planned file\n"
        "  auto                         file screenshots and screen recordings\n"
        "  assign <folder> <file...>    choose the destination folder\n"
        "  year <year> <file...>        set the year of files without one\n"
        "  category <name> <file...>    normal, screenshot or screen-recording\n"
        "  clear <file...>              forget year, folder and category choices\n"
        "  delete <file...>             move pending files to the trash\n"
        "  conflicts [--all]            files stored in more than one folder\n"
        "  ignore <file...>             accept duplicates of these names\n"
        "  unignore <file...>\n"
        "  folders <year>               list folders of a year\n"
        "  mkdir <year> <name>          create a folder\n"
        "  purge                        trash auto-folder copies already filed elsewhere\n"
        "  prune-frames                 drop cached frames of vanished videos\n"
        "  set-root <dir>               remember the camera folder\n");
}

std::optional<ParsedArguments> parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    int i = 1;
    for (; i < argc; ++i) {
        if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            parsed.root = argv[++i];
            continue;
        }
        if (std::strcmp(argv[i], "--config-dir") == 0 && i + 1 < argc) {
            parsed.config_dir = argv[++i];
            continue;
        }
        if (std::strncmp(argv[i], "--", 2) == 0) {
            return std::nullopt;
        }
        break;
    }
    if (i >= argc) {
        return std::nullopt;
    }
    parsed.command = argv[i++];
    for (; i < argc; ++i) {
        parsed.args.emplace_back(argv[i]);
    }
    return parsed;
}

std::optional<int> parse_int(const std::string& text)
{
    int value = 0;
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

void set_env(const char* key, const std::string& value)
{
#ifdef _WIN32
    _putenv_s(key, value.c_str());
#else
    setenv(key, value.c_str(), 1);
#endif
}

std::string describe(const FileEntry& entry)
{
    std::string line = fmt::format("{:<40} {:<18} {:<6} {}",
        entry.identity,
        to_string(entry.state),
        entry.year ? std::to_string(*entry.year) : std::string("----"),
        entry.assigned_folder.empty() ? std::string("-") : entry.assigned_folder);
    if (!entry.duplicate_of.empty()) {
        line += fmt::format("  (also in {})", entry.duplicate_of);
    }
    if (entry.trash_eligible) {
        line += "  [trash]";
    }
    return line;
}

int print_summary(const ApplySummary& summary)
{
    for (const auto& result : summary.results) {
        if (result.outcome == ApplyOutcome::Succeeded) {
            if (result.renamed) {
                fmt::print("renamed  {} -> {}\n", result.identity, result.final_path);
            }
            continue;
        }
        fmt::print("{:<8} {}: {} [{}]\n", to_string(result.outcome), result.identity,
                   result.reason, static_cast<int>(result.code));
    }
    fmt::print("{}\n", summary.to_string());
    return summary.all_succeeded() ? kExitSuccess : kExitEntryFailed;
}

int cmd_scan(CameraSession& session)
{
    const Inventory& inventory = session.scan();
    for (const auto& entry : inventory.pending) {
        fmt::print("{}\n", describe(entry));
    }
    fmt::print("{} file(s) to organize, {} folder(s), {} conflict(s)\n",
               inventory.pending.size(), inventory.folders.size(),
               inventory.duplicates.reported_conflicts().size());
    if (inventory.skipped_other_files > 0) {
        fmt::print("{} non-media file(s) left alone\n", inventory.skipped_other_files);
    }
    if (inventory.unfiled_year_files > 0) {
        fmt::print("{} file(s) lie directly in a year folder\n", inventory.unfiled_year_files);
    }
    for (const auto& identity : session.orphaned_edits()) {
        fmt::print("saved edit without pending file: {}\n", identity);
    }
    for (const auto& warning : inventory.warnings) {
        fmt::print(stderr, "warning: {}\n", warning);
    }
    return kExitSuccess;
}

int cmd_plan(CameraSession& session)
{
    session.scan();
    const BatchPlan batch = session.plan();
    for (const auto& move : batch.moves) {
        if (move.action == PlanAction::Trash) {
            fmt::print("{:<40} -> trash\n", move.identity);
        } else {
            fmt::print("{:<40} -> {}{}\n", move.identity, move.relative_target,
                       move.renamed ? "  (renamed)" : "");
        }
    }
    for (const auto& blocked : batch.blocked) {
        fmt::print("{:<40} {}\n", blocked.identity, to_string(blocked.status));
    }
    return kExitSuccess;
}

int cmd_conflicts(CameraSession& session, bool include_ignored)
{
    session.scan();
    const auto conflicts = session.conflicts(include_ignored);
    for (const auto& conflict : conflicts) {
        std::string folders;
        for (const auto& folder : conflict.folders) {
            if (!folders.empty()) {
                folders += ", ";
            }
            folders += folder.label();
        }
        fmt::print("{}{}: {}\n", conflict.identity, conflict.ignored ? " (ignored)" : "", folders);
    }
    fmt::print("{} conflict(s)\n", conflicts.size());
    return kExitSuccess;
}

int run_command(CameraSession& session, const ParsedArguments& parsed)
{
    const std::string& command = parsed.command;
    const auto& args = parsed.args;

    if (command == "scan") {
        return cmd_scan(session);
    }
    if (command == "plan") {
        return cmd_plan(session);
    }
    if (command == "apply") {
        session.scan();
        return print_summary(session.apply());
    }
    if (command == "auto") {
        session.scan();
        return print_summary(session.auto_organize());
    }
    if (command == "assign" && args.size() >= 2) {
        session.scan();
        session.assign_folder(std::vector<std::string>(args.begin() + 1, args.end()), args.front());
        return kExitSuccess;
    }
    if (command == "year" && args.size() >= 2) {
        const auto year = parse_int(args.front());
        if (!year) {
            THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_INPUT, args.front());
        }
        session.scan();
        session.set_year(std::vector<std::string>(args.begin() + 1, args.end()), *year);
        return kExitSuccess;
    }
    if (command == "category" && args.size() >= 2) {
        const auto category = category_from_string(args.front());
        if (!category) {
            THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_INPUT, args.front());
        }
        session.scan();
        session.set_category(std::vector<std::string>(args.begin() + 1, args.end()), *category);
        return kExitSuccess;
    }
    if (command == "clear" && !args.empty()) {
        session.scan();
        session.clear_assignment(args);
        return kExitSuccess;
    }
    if (command == "delete" && !args.empty()) {
        session.scan();
        return print_summary(session.delete_entries(args));
    }
    if (command == "conflicts") {
        return cmd_conflicts(session, !args.empty() && args.front() == "--all");
    }
    if ((command == "ignore" || command == "unignore") && !args.empty()) {
        for (const auto& identity : args) {
            const bool changed = command == "ignore" ? session.ignore(identity)
                                                     : session.unignore(identity);
            if (!changed) {
                fmt::print("{}: unchanged\n", identity);
            }
        }
        return kExitSuccess;
    }
    if (command == "folders" && args.size() == 1) {
        const auto year = parse_int(args.front());
        if (!year) {
            THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_INPUT, args.front());
        }
        for (const auto& folder : session.list_folders(*year)) {
            fmt::print("{} {} ({} file(s))\n", folder.color_tag, folder.name, folder.members.size());
        }
        return kExitSuccess;
    }
    if (command == "mkdir" && args.size() == 2) {
        const auto year = parse_int(args.front());
        if (!year) {
            THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_INPUT, args.front());
        }
        const OrganizedFolder folder = session.create_folder(*year, args[1]);
        fmt::print("{}\n", folder.path);
        return kExitSuccess;
    }
    if (command == "purge") {
        session.scan();
        return print_summary(session.purge_redundant_copies());
    }
    if (command == "prune-frames") {
        session.scan();
        fmt::print("{} cached frame(s) removed\n", session.prune_frame_cache());
        return kExitSuccess;
    }
    if (command == "set-root" && args.size() == 1) {
        session.set_root(args.front());
        return kExitSuccess;
    }

    print_usage();
    return kExitUsage;
}

int run_application(int argc, char** argv, const ParsedArguments& parsed)
{
    QCoreApplication::setApplicationName(QStringLiteral("CameraSorter"));
    QCoreApplication app(argc, argv);

    Settings settings;
    settings.load();
    if (!initialize_loggers(settings.get_log_dir())) {
        return kExitUsage;
    }
    Logger::apply_configured_level(settings.get_log_level());
    auto logger = Logger::get_logger("cli_logger");

    if (!parsed.root.empty()) {
        settings.set_camera_path(parsed.root);
    }
    if (logger) {
        logger->info("Running '{}' on '{}'", parsed.command, settings.get_camera_path());
    }

    FilenamePathClassifier classifier;
    SystemTrash trash;
    CameraSession session(settings, classifier, trash);
    session.load_state();

    try {
        return run_command(session, parsed);
    } catch (const ErrorCodes::AppException& ex) {
        if (logger) {
            logger->error("{}", ex.get_full_details());
        }
        fmt::print(stderr, "Error {}: {}\n", ex.get_error_code_int(), ex.get_user_message());
        return kExitUsage;
    }
}

} // namespace


int main(int argc, char **argv) {
    const auto parsed = parse_command_line(argc, argv);
    if (!parsed) {
        print_usage();
        return kExitUsage;
    }
    if (!parsed->config_dir.empty()) {
        set_env("CAMERA_SORTER_CONFIG_DIR", parsed->config_dir);
    }

    try {
        return run_application(argc, argv, *parsed);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("cli_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return kExitUsage;
    }
}
