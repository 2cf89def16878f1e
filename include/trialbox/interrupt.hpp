#pragma once

// trialbox/interrupt.hpp - User-interrupt flag (SIGINT/SIGTERM).
//
// The handler only stores to a lock-free atomic, which is async-signal-safe.
// Long-running code polls interrupt_requested() between stages, between
// tasks, and inside run_process()'s wait loop, then raises InterruptedError
// so the open AttemptLedger records INTERRUPTED.

namespace trialbox {

// Installs the handler for SIGINT and SIGTERM. Idempotent.
void install_interrupt_handler();

bool interrupt_requested();

// Sets the flag without a signal (tests, embedding callers).
void request_interrupt();

void clear_interrupt();

}  // namespace trialbox
