/*
 * context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef EMUFLOW_DISPATCHER_CONTEXT_HPP
#define EMUFLOW_DISPATCHER_CONTEXT_HPP

#include "task/fields.hpp"

namespace emuflow::dispatch {

/**
 * @brief Variables shared by every task of a run.
 *
 * Resolution precedence is global < task-local < overrides.
 */
struct DispatcherContext {
    task::VariableMap globalVars;
    task::VariableMap overrideVars;
};

}  // namespace emuflow::dispatch

#endif  // EMUFLOW_DISPATCHER_CONTEXT_HPP
