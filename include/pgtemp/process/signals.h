#pragma once

#include <sys/types.h>

namespace pgtemp::process {

/**
 * @brief Catch SIGINT, SIGTERM and SIGQUIT for an orderly shutdown
 *
 * The handler only records the first signal received, so whatever is running
 * (server setup, a child command) finishes and the caller can clean up. A
 * SIGTERM is also passed on to the process set with forwardTerminationTo().
 * Children get default dispositions back when they exec.
 */
void installShutdownHandlers();

// Put the default dispositions back
void restoreDefaultHandlers();

// First signal received since install/reset, or 0
int shutdownSignal() noexcept;
void resetShutdownSignal() noexcept;

// pid that receives forwarded SIGTERMs; 0 stops forwarding
void forwardTerminationTo(pid_t pid) noexcept;

/**
 * @brief Block until a shutdown signal has been received
 * @return The signal number (immediately, if one is already recorded)
 */
int waitForShutdown();

} // namespace pgtemp::process
