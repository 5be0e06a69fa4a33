/*
 * dry_run_session.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Session that records commands instead of running them

**************************************************/

#ifndef EMUFLOW_SHELL_DRY_RUN_SESSION_HPP
#define EMUFLOW_SHELL_DRY_RUN_SESSION_HPP

#include <mutex>
#include <string>
#include <vector>

#include "session.hpp"

namespace emuflow::shell {

/**
 * @class DryRunSession
 * @brief Records every command sent and reports immediate success.
 */
class DryRunSession final : public ShellSession {
public:
    explicit DryRunSession(std::string shell, int exitStatus = 0);

    void open() override;
    void close() noexcept override;
    void send(std::string_view command) override;
    [[nodiscard]] SessionReply expect(
        const std::string& pattern,
        std::optional<std::chrono::seconds> timeout) override;
    [[nodiscard]] SessionReply waitForPrompt(
        std::optional<std::chrono::seconds> timeout) override;
    [[nodiscard]] int exitStatus() override;

    [[nodiscard]] auto getShell() const -> const std::string&;
    [[nodiscard]] auto isOpen() const -> bool;
    [[nodiscard]] auto getSentCommands() const -> std::vector<std::string>;

    /**
     * @brief Factory creating a dry-run session for every shell.
     */
    [[nodiscard]] static SessionFactory factory();

private:
    std::string shell_;
    int exitStatus_;
    bool open_{false};
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
};

}  // namespace emuflow::shell

#endif  // EMUFLOW_SHELL_DRY_RUN_SESSION_HPP
