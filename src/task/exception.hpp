/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-1-4

Description: Task and dispatcher exceptions

**************************************************/

#ifndef EMUFLOW_TASK_EXCEPTION_HPP
#define EMUFLOW_TASK_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace emuflow {

// ============================================================================
// Configuration Exceptions
// ============================================================================
// Raised before any shell interaction; always fatal to the run.

/**
 * @brief A task or command definition is malformed (missing field, unknown
 * key, wrong value type, unparsable text).
 */
class InvalidTaskDefinition : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief A task with the same name is already registered.
 */
class DuplicateTask : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief A task name was looked up or referenced but is not registered.
 */
class TaskNotFound : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief The combined requires/before relation contains a cycle.
 */
class CircularDependency : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief A `${{name}}` placeholder has no value in the merged scope.
 */
class UnresolvedVariable : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief The run description is invalid.
 */
class InvalidRunConfig : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief A dispatcher operation was attempted in the wrong phase, e.g.
 * mutating tasks after evaluation started.
 */
class InvalidDispatcherState : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Transport Exceptions
// ============================================================================

/**
 * @brief The shell session is unreachable or disconnected. Fatal to the
 * remaining tasks of that shell.
 */
class SessionError : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define THROW_INVALID_TASK_DEFINITION(...)                              \
    throw emuflow::InvalidTaskDefinition(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                         ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_DUPLICATE_TASK(...)                                \
    throw emuflow::DuplicateTask(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                 ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_TASK_NOT_FOUND(...)                               \
    throw emuflow::TaskNotFound(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_CIRCULAR_DEPENDENCY(...)                                \
    throw emuflow::CircularDependency(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                      ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_UNRESOLVED_VARIABLE(...)                                \
    throw emuflow::UnresolvedVariable(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                      ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_RUN_CONFIG(...)                               \
    throw emuflow::InvalidRunConfig(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_DISPATCHER_STATE(...)                               \
    throw emuflow::InvalidDispatcherState(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_SESSION_ERROR(...)                                \
    throw emuflow::SessionError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace emuflow

#endif  // EMUFLOW_TASK_EXCEPTION_HPP
