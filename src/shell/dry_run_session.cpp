/*
 * dry_run_session.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "dry_run_session.hpp"

#include "spdlog/spdlog.h"
#include "task/exception.hpp"

namespace emuflow::shell {

DryRunSession::DryRunSession(std::string shell, int exitStatus)
    : shell_(std::move(shell)), exitStatus_(exitStatus) {}

void DryRunSession::open() {
    std::lock_guard lock(mutex_);
    open_ = true;
    spdlog::info("[{}] dry-run session opened", shell_);
}

void DryRunSession::close() noexcept {
    std::lock_guard lock(mutex_);
    if (open_) {
        open_ = false;
        spdlog::info("[{}] dry-run session closed after {} commands", shell_,
                     sent_.size());
    }
}

void DryRunSession::send(std::string_view command) {
    std::lock_guard lock(mutex_);
    if (!open_) {
        THROW_SESSION_ERROR("Session '" + shell_ + "' is not open");
    }
    spdlog::info("[{}] $ {}", shell_, command);
    sent_.emplace_back(command);
}

SessionReply DryRunSession::expect(
    const std::string& pattern,
    [[maybe_unused]] std::optional<std::chrono::seconds> timeout) {
    spdlog::debug("[{}] assuming output matches '{}'", shell_, pattern);
    return {true, {}};
}

SessionReply DryRunSession::waitForPrompt(
    [[maybe_unused]] std::optional<std::chrono::seconds> timeout) {
    return {true, {}};
}

int DryRunSession::exitStatus() { return exitStatus_; }

auto DryRunSession::getShell() const -> const std::string& { return shell_; }

auto DryRunSession::isOpen() const -> bool {
    std::lock_guard lock(mutex_);
    return open_;
}

auto DryRunSession::getSentCommands() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    return sent_;
}

SessionFactory DryRunSession::factory() {
    return [](const std::string& shell) -> std::unique_ptr<ShellSession> {
        return std::make_unique<DryRunSession>(shell);
    };
}

}  // namespace emuflow::shell
