#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/data_span.hpp"
#include "../util/event.hpp"
#include "config.hpp"
#include "message.hpp"
#include "storage.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace j1939tp {
    namespace transport {

        // ─── Reassembly session state ────────────────────────────────────────────────
        enum class SessionState : u8 {
            Active,   // accepting TP.DT
            Complete, // every packet received, payload readable
            Aborted   // terminal, every further TP.DT is rejected
        };

        // ─── Failed transition ───────────────────────────────────────────────────────
        // The local error and the abort frame the caller should put on the bus.
        struct Rejection {
            Error error;
            ConnectionAbort abort;
        };

        using Step = dp::Result<dp::Optional<Response>, Rejection>;

        // ─── Receiver side of one RTS/CTS transfer ───────────────────────────────────
        // Created from the sender's RTS; fed TP.DT frames in bus order. There is no
        // segment retransmission in TP, so any sequencing fault ends the session and
        // a new RTS (and a new session) is needed.
        class ReassemblySession {
            RequestToSend rts_;
            ReassemblyBuffer buffer_;
            SessionConfig config_;
            dp::Optional<u8> burst_;
            u8 received_ = 0;
            SessionState state_ = SessionState::Active;

            ReassemblySession(RequestToSend rts, ReassemblyBuffer buffer, SessionConfig config)
                : rts_(std::move(rts)), buffer_(std::move(buffer)), config_(std::move(config)) {
                burst_ = effective_burst(rts_.max_packets_per_response, config_.max_packets_per_cts);
                buffer_.begin(rts_.total_size);
            }

            static dp::Optional<u8> effective_burst(const dp::Optional<u8> &offered, const dp::Optional<u8> &cap) {
                if (!offered.has_value())
                    return cap;
                if (!cap.has_value())
                    return offered;
                return offered.value() < cap.value() ? offered.value() : cap.value();
            }

            ConnectionAbort make_abort(AbortReason reason) const noexcept {
                return ConnectionAbort{reason, AbortSenderRole::Receiver, rts_.pgn};
            }

            Step reject(Error error, AbortReason reason) {
                return Step::err(Rejection{std::move(error), make_abort(reason)});
            }

            Step fail(Error error, AbortReason reason) {
                state_ = SessionState::Aborted;
                echo::category("j1939tp.transport.session")
                    .warn("session aborted: pgn=", rts_.pgn, " reason=", abort_reason_name(reason),
                          " received=", static_cast<u32>(received_), "/", static_cast<u32>(rts_.total_packets));
                on_abort.emit(reason);
                return reject(std::move(error), reason);
            }

          public:
            // ─── Construction ────────────────────────────────────────────────────────
            static Result<ReassemblySession> create(RequestToSend rts,
                                                    ReassemblyBuffer buffer = ReassemblyBuffer::growable(),
                                                    SessionConfig config = {}) {
                auto rts_ok = rts.validate();
                if (rts_ok.is_err()) {
                    echo::category("j1939tp.transport.session").error("invalid RTS: ", rts_ok.error().message);
                    return Result<ReassemblySession>::err(rts_ok.error());
                }
                auto config_ok = enforce_session_config(config);
                if (config_ok.is_err()) {
                    return Result<ReassemblySession>::err(config_ok.error());
                }
                if (!buffer.fits(rts.total_size)) {
                    echo::category("j1939tp.transport.session")
                        .warn("fixed region of ", buffer.region_size(), " bytes cannot hold ", rts.total_size,
                              " bytes, transfer will abort");
                }
                echo::category("j1939tp.transport.session")
                    .debug("session created: pgn=", rts.pgn, " bytes=", rts.total_size,
                           " packets=", static_cast<u32>(rts.total_packets),
                           " storage=", buffer.kind() == StorageKind::Fixed ? "fixed" : "growable");
                return Result<ReassemblySession>::ok(
                    ReassemblySession(std::move(rts), std::move(buffer), std::move(config)));
            }

            // ─── Feed the next TP.DT ─────────────────────────────────────────────────
            Step next(const DataTransfer &dt) {
                if (state_ == SessionState::Aborted) {
                    return reject(Error::previous_abort(), AbortReason::UnexpectedDataTransfer);
                }
                if (state_ == SessionState::Complete) {
                    echo::category("j1939tp.transport.session")
                        .warn("DT after completion: pgn=", rts_.pgn, " seq=", static_cast<u32>(dt.sequence));
                    return reject(Error::already_complete(), AbortReason::UnexpectedDataTransfer);
                }

                u8 expected = static_cast<u8>(received_ + 1);
                if (dt.sequence != expected) {
                    return fail(Error::sequence(expected, dt.sequence), AbortReason::BadSequenceNumber);
                }

                auto stored = buffer_.write_segment(dt.sequence, DataSpan(dt.data));
                if (stored.is_err()) {
                    return fail(stored.error(), AbortReason::Custom);
                }

                ++received_;
                echo::category("j1939tp.transport.session")
                    .trace("DT accepted: seq=", static_cast<u32>(dt.sequence), "/",
                           static_cast<u32>(rts_.total_packets));

                if (received_ == rts_.total_packets) {
                    state_ = SessionState::Complete;
                    buffer_.finish();
                    echo::category("j1939tp.transport.session")
                        .debug("session complete: pgn=", rts_.pgn, " bytes=", rts_.total_size);
                    on_complete.emit(buffer_.view());
                    auto eoma = EndOfMessageAck::acknowledging(rts_);
                    return Step::ok(dp::Optional<Response>(Response::end_of_message(std::move(eoma))));
                }

                if (burst_.has_value() && dt.sequence % burst_.value() == 0) {
                    ClearToSend cts{burst_, static_cast<u8>(received_ + 1), rts_.pgn};
                    return Step::ok(dp::Optional<Response>(Response::clear_to_send(std::move(cts))));
                }

                return Step::ok(dp::Optional<Response>{});
            }

            // ─── Abort from outside (e.g. a T1 supervisor) ───────────────────────────
            Result<ConnectionAbort> abort(AbortReason reason) {
                if (state_ != SessionState::Active) {
                    return Result<ConnectionAbort>::err(Error::invalid_state("session is not active"));
                }
                auto rejected = fail(Error::transport_aborted(abort_reason_name(reason)), reason);
                return Result<ConnectionAbort>::ok(rejected.error().abort);
            }

            // Reassembled message, only once complete
            dp::Optional<DataSpan> payload() const noexcept {
                if (state_ == SessionState::Aborted || received_ < rts_.total_packets)
                    return dp::nullopt;
                return buffer_.view();
            }

            // ─── Accessors ───────────────────────────────────────────────────────────
            const RequestToSend &request() const noexcept { return rts_; }
            SessionState state() const noexcept { return state_; }
            bool is_complete() const noexcept { return state_ == SessionState::Complete; }
            bool is_aborted() const noexcept { return state_ == SessionState::Aborted; }
            u8 received_packets() const noexcept { return received_; }
            u8 total_packets() const noexcept { return rts_.total_packets; }
            const dp::Optional<u8> &burst() const noexcept { return burst_; }
            StorageKind storage_kind() const noexcept { return buffer_.kind(); }

            f32 progress() const noexcept {
                return static_cast<f32>(received_) / static_cast<f32>(rts_.total_packets);
            }

            // ─── Events ──────────────────────────────────────────────────────────────
            Event<DataSpan> on_complete;
            Event<AbortReason> on_abort;
        };

    } // namespace transport
    using namespace transport;
} // namespace j1939tp
