//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <libqr/package_manager.h>

namespace ui {

// --- ANSI Color Codes ---
    const char* const RESET = "\033[0m";
    const char* const BOLD = "\033[1m";
    const char* const BLUE = "\033[1;34m";
    const char* const GREEN = "\033[0;32m";
    const char* const RED = "\033[1;31m";
    const char* const YELLOW = "\033[1;33m";
    const char* const CYAN = "\033[0;36m";
    const char* const MAGENTA = "\033[1;35m";

// --- Formatted Printing Functions ---

    void action(const std::string& msg) {
        std::cout << BLUE << ":: " << RESET << BOLD << msg << RESET << std::endl;
    }

    void header(const std::string& msg) {
        std::cout << BOLD << msg << RESET << std::endl;
    }

    void item(const std::string& msg) {
        std::cout << " " << GREEN << "-" << RESET << " " << msg << std::endl;
    }

    void detail(const std::string& msg) {
        std::cout << "   " << CYAN << msg << RESET << std::endl;
    }

    void error(const std::string& msg) {
        std::cerr << RED << "error: " << RESET << msg << std::endl;
    }

    void warning(const std::string& msg) {
        std::cout << YELLOW << "warning: " << RESET << msg << std::endl;
    }

// Asks the user a "Yes/No" question.
    bool confirm(const std::string& question) {
        std::cout << CYAN << ":: " << RESET << BOLD << question << " [Y/n] " << RESET;
        std::string response;
        std::getline(std::cin, response);
        return response.empty() || response[0] == 'y' || response[0] == 'Y';
    }

    std::string flags_to_string(const qr::UseFlagSet& flags) {
        std::string out;
        for (const auto& flag : flags) {
            out += (out.empty() ? "" : " ") + flag;
        }
        return out;
    }

    // Prints the operations of a plan followed by the resolver's decision trail.
    void print_transaction_summary(const qr::Plan& plan, bool verbose) {
        const auto print_kind = [&](qr::Operation::Kind kind, const std::string& title) {
            bool printed = false;
            for (const auto& op : plan.operations) {
                if (op.kind != kind) continue;
                if (!printed) {
                    header("\n" + title);
                    printed = true;
                }
                std::string line = op.describe();
                if (!op.use_flags.empty()) {
                    line += std::string(" ") + CYAN + "USE=\"" + flags_to_string(op.use_flags) + "\"" + RESET;
                }
                item(line);
            }
        };
        print_kind(qr::Operation::Kind::Remove, "Packages to remove:");
        print_kind(qr::Operation::Kind::Upgrade, "Packages to upgrade:");
        print_kind(qr::Operation::Kind::Install, "Packages to install:");

        const auto& resolution = plan.resolution;
        if (!resolution.blocker_actions.empty()) {
            header("\nBlockers:");
            for (const auto& action : resolution.blocker_actions) {
                item(action.blocker.to_string() + ": " + action.describe());
            }
        }
        if (!resolution.cycles.empty()) {
            header("\nCircular dependencies:");
            for (const auto& cycle : resolution.cycles) {
                item(cycle.describe());
            }
        }
        for (const auto& [id, flags] : resolution.disabled_use_flags) {
            warning("USE flags disabled on " + id.full_name() + " to break a cycle: " + flags_to_string(flags));
        }
        if (resolution.backtracks > 0) {
            warning("Resolver backtracked " + std::to_string(resolution.backtracks) + " time(s)");
        }
        if (verbose && !resolution.decisions.empty()) {
            header("\nResolver decisions:");
            for (const auto& decision : resolution.decisions) {
                detail(decision.to_string());
            }
        }
        std::cout << std::endl;
    }

} // namespace ui
