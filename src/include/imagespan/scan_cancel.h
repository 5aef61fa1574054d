#pragma once

/**
 * \file scan_cancel.h
 * \brief Cooperative cancellation predicate polled by scans and decodes.
 */

namespace imagespan {

/**
 * \brief Caller-supplied cancellation check.
 *
 * `should_cancel` is polled at fixed byte intervals and must be cheap and
 * thread-safe with respect to whatever sets it (typically an atomic flag
 * behind \ref user). A null callback never cancels.
 */
struct ScanCancel final {
    bool (*should_cancel)(void* user) noexcept = nullptr;
    void* user                                 = nullptr;

    bool requested() const noexcept
    {
        return should_cancel != nullptr && should_cancel(user);
    }
};

}  // namespace imagespan
