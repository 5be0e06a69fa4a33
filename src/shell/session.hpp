/*
 * session.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Interactive shell session driven by the dispatcher

**************************************************/

#ifndef EMUFLOW_SHELL_SESSION_HPP
#define EMUFLOW_SHELL_SESSION_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace emuflow::shell {

/**
 * @brief Result of waiting on a session.
 */
struct SessionReply {
    bool matched{};      ///< False if the timeout expired first
    std::string output;  ///< Raw output received while waiting
};

/**
 * @class ShellSession
 * @brief A persistent interactive shell (host, emulator monitor, target
 * console, ...).
 *
 * Transports (SSH, serial console, subprocess pipe) implement this interface.
 * A session is used by one worker thread at a time. Transport failures are
 * reported by throwing SessionError.
 */
class ShellSession {
public:
    virtual ~ShellSession() = default;

    /**
     * @brief Connects to the shell. Called once before the first command.
     * @throws SessionError If the shell cannot be reached.
     */
    virtual void open() = 0;

    virtual void close() noexcept = 0;

    /**
     * @brief Sends one command line.
     * @throws SessionError On disconnect.
     */
    virtual void send(std::string_view command) = 0;

    /**
     * @brief Waits until the output matches the regular expression
     * @p pattern.
     *
     * @param timeout Maximum wait; empty waits forever.
     * @throws SessionError On disconnect.
     */
    [[nodiscard]] virtual SessionReply expect(
        const std::string& pattern,
        std::optional<std::chrono::seconds> timeout) = 0;

    /**
     * @brief Waits until the current command returns to the prompt.
     *
     * @param timeout Maximum wait; empty waits forever.
     * @throws SessionError On disconnect.
     */
    [[nodiscard]] virtual SessionReply waitForPrompt(
        std::optional<std::chrono::seconds> timeout) = 0;

    /**
     * @brief Exit status of the last completed command.
     * @throws SessionError On disconnect.
     */
    [[nodiscard]] virtual int exitStatus() = 0;
};

/**
 * @brief Creates the session for a shell name; returns nullptr when no
 * transport is available for that shell.
 */
using SessionFactory =
    std::function<std::unique_ptr<ShellSession>(const std::string& shell)>;

}  // namespace emuflow::shell

#endif  // EMUFLOW_SHELL_SESSION_HPP
