#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace j1939tp {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        InvalidParameter, // caller-supplied construction parameter out of range
        InvalidState,
        StorageTooSmall,  // fixed storage has fewer windows than the transfer needs
        Sequence,         // out-of-order or duplicate TP.DT
        PreviousAbort,    // TP.DT after the session already aborted
        AlreadyComplete,  // TP.DT after the final segment was accepted
        TransportAborted,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error invalid_parameter(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidParameter, std::move(msg));
        }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error storage_too_small(u8 sequence) noexcept {
            return Error(ErrorCode::StorageTooSmall,
                         "storage too small for segment " + dp::String(std::to_string(sequence)));
        }
        static Error sequence(u8 expected, u8 got) noexcept {
            return Error(ErrorCode::Sequence, "expected sequence " + dp::String(std::to_string(expected)) +
                                                  ", got " + dp::String(std::to_string(got)));
        }
        static Error previous_abort() noexcept { return Error(ErrorCode::PreviousAbort, "session already aborted"); }
        static Error already_complete() noexcept {
            return Error(ErrorCode::AlreadyComplete, "session already complete");
        }
        static Error transport_aborted(dp::String msg = "") noexcept {
            return Error(ErrorCode::TransportAborted, std::move(msg));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace j1939tp
