#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <unistd.h> // For geteuid()
#include <functional> // For std::function
#include <optional>

#include "ui_helpers.h"
#include <libqr/logging.h>
#include <libqr/package_manager.h>

void print_usage() {
    ui::error("Invalid usage.");
    std::cerr << "Usage: quarry [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  --root <dir>        Operate on a different system root\n"
              << "  --config <file>     Read configuration from <file>\n"
              << "  --force             Bypass safety checks\n"
              << "  --nodeps            Do not pull in dependencies\n"
              << "  --oneshot           Do not mark packages as explicitly installed\n"
              << "  --pretend           Show what would be done and stop\n"
              << "  --jobs <n>          Run up to <n> builds in parallel\n"
              << "  --use \"<flags>\"     Extra USE flags, \"-flag\" disables\n"
              << "  --yes               Do not ask for confirmation\n"
              << "  --verbose           Print resolver decisions and file operations\n\n"
              << "Commands:\n"
              << "  install <pkg>...    Build and install packages\n"
              << "  remove <pkg>...     Remove packages\n"
              << "  update              Update every installed package\n"
              << "  depclean            Remove packages nothing depends on\n"
              << "  list                List installed packages\n"
              << "  owner <path>        Show the package that owns a file\n"
              << "  verify              Check installed files against the database\n";
}

std::string error_to_string(qr::ErrorCode err) {
    switch (err) {
        case qr::ErrorCode::ResolutionFailed: return "Could not resolve dependencies.";
        case qr::ErrorCode::CircularDependency: return "An unbreakable circular dependency was found.";
        case qr::ErrorCode::SlotConflict: return "Two packages want the same slot.";
        case qr::ErrorCode::VersionConflict: return "The chosen version breaks an installed package.";
        case qr::ErrorCode::InvalidBlocker: return "A package declares an invalid blocker.";
        case qr::ErrorCode::PackageNotFound: return "Package not found in the repository.";
        case qr::ErrorCode::PackageNotInstalled: return "One or more packages are not installed.";
        case qr::ErrorCode::AmbiguousPackage: return "Package name is ambiguous; please use category/name.";
        case qr::ErrorCode::HasDependents: return "Other installed packages still depend on it.";
        case qr::ErrorCode::InvalidVersion: return "Invalid version.";
        case qr::ErrorCode::InvalidAtom: return "Invalid package atom.";
        case qr::ErrorCode::ParseError: return "The repository index could not be parsed.";
        case qr::ErrorCode::ConfigError: return "The configuration is invalid.";
        case qr::ErrorCode::BuildFailed: return "A package failed to build.";
        case qr::ErrorCode::FileCollision: return "A file collision was detected.";
        case qr::ErrorCode::ExtractionFailed: return "Failed to extract a build artifact.";
        case qr::ErrorCode::TransactionFailed: return "The transaction failed.";
        case qr::ErrorCode::TransactionRolledBack: return "The transaction was rolled back.";
        case qr::ErrorCode::DatabaseError: return "A database error occurred.";
        case qr::ErrorCode::FileSystemError: return "A filesystem error occurred.";
        default: return "An unknown error occurred.";
    }
}

void report_error(const qr::Error& err) {
    std::string sentence = error_to_string(err.code);
    if (err.cause) {
        sentence += " Cause: " + error_to_string(*err.cause);
    }
    ui::error(sentence);
    ui::detail(err.message);
    for (const auto& pkg : err.packages) {
        ui::item(pkg);
    }
}

struct CliOptions {
    qr::InstallOptions install;
    bool assume_yes = false;
    bool verbose = false;
};

// Plan -> summary -> confirm -> execute.
int handle_transaction(
    const std::string& action_name,
    qr::PackageManager& pm,
    const CliOptions& cli,
    std::function<qr::Result<qr::Plan>()> plan_func
) {
    auto plan_result = plan_func();
    if (!plan_result) {
        report_error(plan_result.error());
        return 1;
    }

    const qr::Plan& plan = *plan_result;
    if (plan.empty()) {
        ui::header("Nothing to do.");
        return 0;
    }

    ui::print_transaction_summary(plan, cli.verbose);
    if (cli.install.pretend) {
        ui::header("Pretend mode, nothing was changed.");
        return 0;
    }
    if (!cli.assume_yes && !ui::confirm("Proceed with " + action_name + "?")) {
        ui::warning(action_name + " aborted by user.");
        return 0;
    }

    auto exec_result = pm.execute(plan, cli.install);
    if (exec_result) {
        ui::header(action_name + " completed successfully.");
        return 0;
    }

    report_error(exec_result.error());
    return 1;
}

// --- COMMAND HANDLERS ---

int do_list(qr::PackageManager& pm) {
    const auto installed = pm.list_installed();
    if (installed.empty()) {
        ui::header("No packages installed.");
        return 0;
    }
    for (const auto& pkg : installed) {
        std::string line = pkg.display_name() + ":" + pkg.slot;
        if (pkg.explicit_install) line += std::string(" ") + ui::BOLD + "[explicit]" + ui::RESET;
        if (!pkg.use_flags.empty()) line += " USE=\"" + ui::flags_to_string(pkg.use_flags) + "\"";
        ui::item(line);
    }
    return 0;
}

int do_owner(qr::PackageManager& pm, const std::string& path) {
    auto owner = pm.find_owner(path);
    if (!owner) {
        ui::warning(path + " is not owned by any package.");
        return 1;
    }
    ui::item(path + " is owned by " + owner->full_name());
    return 0;
}

int do_verify(qr::PackageManager& pm) {
    ui::action("Verifying installed files...");
    int failures = 0;
    for (const auto& result : pm.verify()) {
        if (result.ok()) continue;
        ++failures;
        ui::header(result.id.full_name() + ":" + result.slot);
        for (const auto& path : result.missing) ui::item("missing: " + path);
        for (const auto& path : result.modified) ui::item("modified: " + path);
    }
    if (failures == 0) {
        ui::header("All installed files are intact.");
        return 0;
    }
    return 1;
}

// --- Main Function ---

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string root = "/";
    std::string config_file;
    CliOptions cli;
    std::vector<std::string> extra_use;
    unsigned jobs = 0;

    std::vector<std::string> main_args;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const auto value = [&](const std::string& name) -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                ui::error(name + " requires an argument.");
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "--root") {
            auto v = value(arg);
            if (!v) return 1;
            root = *v;
        } else if (arg == "--config") {
            auto v = value(arg);
            if (!v) return 1;
            config_file = *v;
        } else if (arg == "--jobs") {
            auto v = value(arg);
            if (!v) return 1;
            try {
                jobs = static_cast<unsigned>(std::stoul(*v));
            } catch (const std::exception&) {
                ui::error("--jobs expects a number, got '" + *v + "'.");
                return 1;
            }
        } else if (arg == "--use") {
            auto v = value(arg);
            if (!v) return 1;
            std::istringstream in(*v);
            for (std::string flag; in >> flag;) extra_use.push_back(flag);
        } else if (arg == "--force") {
            cli.install.force = true;
        } else if (arg == "--nodeps") {
            cli.install.no_deps = true;
        } else if (arg == "--oneshot") {
            cli.install.oneshot = true;
        } else if (arg == "--pretend") {
            cli.install.pretend = true;
        } else if (arg == "--yes") {
            cli.assume_yes = true;
        } else if (arg == "--verbose") {
            cli.verbose = true;
        } else {
            main_args.push_back(arg);
        }
    }

    if (main_args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& command = main_args[0];
    const bool read_only = command == "list" || command == "owner" || command == "verify";
    if (root == "/" && !read_only && !cli.install.pretend && geteuid() != 0) {
        ui::error("Quarry must be run as root to modify the system.");
        return 1;
    }

    qr::log::set_verbose(cli.verbose);

    auto config = qr::Config::load(root, config_file);
    if (!config) {
        report_error(config.error());
        return 1;
    }
    if (jobs > 0) config->build.jobs = jobs;

    // Options come from the configuration, then the command line on top.
    const bool force = cli.install.force, no_deps = cli.install.no_deps;
    const bool oneshot = cli.install.oneshot, pretend = cli.install.pretend;
    cli.install = config->install_options();
    cli.install.force = force;
    cli.install.no_deps = no_deps;
    cli.install.oneshot = oneshot;
    cli.install.pretend = pretend;
    cli.install.use_flags.insert(cli.install.use_flags.end(), extra_use.begin(), extra_use.end());

    if (root != "/") {
        ui::header(std::string(ui::MAGENTA) + "Operating on root: " + root + ui::RESET);
    }
    if (cli.install.force) ui::warning("Forcing operation, safety checks are disabled!");

    try {
        auto pm_result = qr::PackageManager::open(std::move(*config));
        if (!pm_result) {
            report_error(pm_result.error());
            return 1;
        }
        qr::PackageManager& pm = **pm_result;

        std::vector<std::string> packages;
        if (main_args.size() > 1) {
            packages.assign(main_args.begin() + 1, main_args.end());
        }

        // Command dispatch.
        if (command == "install") {
            if (packages.empty()) { print_usage(); return 1; }
            ui::action("Resolving dependencies...");
            return handle_transaction("installation", pm, cli, [&]() { return pm.plan_install(packages, cli.install); });
        } else if (command == "remove") {
            if (packages.empty()) { print_usage(); return 1; }
            ui::action("Checking for reverse dependencies...");
            return handle_transaction("removal", pm, cli, [&]() { return pm.plan_remove(packages, cli.install); });
        } else if (command == "update") {
            ui::action("Starting system update...");
            return handle_transaction("update", pm, cli, [&]() { return pm.plan_update(cli.install); });
        } else if (command == "depclean") {
            ui::action("Searching for unneeded packages...");
            return handle_transaction("depclean", pm, cli, [&]() { return pm.plan_depclean(cli.install); });
        } else if (command == "list") {
            return do_list(pm);
        } else if (command == "owner") {
            if (packages.size() != 1) { print_usage(); return 1; }
            return do_owner(pm, packages[0]);
        } else if (command == "verify") {
            return do_verify(pm);
        }
    } catch (const std::exception& e) {
        ui::error(std::string("Fatal: ") + e.what());
        return 1;
    }

    print_usage();
    return 1;
}
