#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/pgn.hpp"
#include "../core/types.hpp"
#include "../util/bitfield.hpp"
#include "../util/data_span.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace j1939tp {
    namespace transport {

        // ─── TP Connection Management byte codes ─────────────────────────────────────
        namespace tp_cm {
            inline constexpr u8 RTS = 0x10;   // Request To Send
            inline constexpr u8 CTS = 0x11;   // Clear To Send
            inline constexpr u8 EOMA = 0x13;  // End Of Message Acknowledgment
            inline constexpr u8 BAM = 0x20;   // Broadcast Announce Message
            inline constexpr u8 ABORT = 0xFF; // Connection Abort
        } // namespace tp_cm

        enum class CmKind : u8 {
            RequestToSend = tp_cm::RTS,
            ClearToSend = tp_cm::CTS,
            EndOfMessageAck = tp_cm::EOMA,
            BroadcastAnnounce = tp_cm::BAM,
            ConnectionAbort = tp_cm::ABORT
        };

        // ─── Connection abort reasons (J1939-21 table 6) ─────────────────────────────
        // The enum holds any byte: a decoded value outside the table is kept as-is so
        // that re-encoding reproduces the original frame.
        enum class AbortReason : u8 {
            MaxConnections = 1,
            CanceledBySystem = 2,
            Timeout = 3,
            CtsWhileDataTransfer = 4,
            RetransmitLimitReached = 5,
            UnexpectedDataTransfer = 6,
            BadSequenceNumber = 7,
            DuplicateSequenceNumber = 8,
            MessageTooLarge = 9,
            Custom = 250 // reason not listed in the table
        };

        inline constexpr bool abort_reason_known(AbortReason reason) noexcept {
            u8 raw = static_cast<u8>(reason);
            return (raw >= 1 && raw <= 9) || reason == AbortReason::Custom;
        }

        // Unlisted codes collapse to Custom
        inline constexpr AbortReason abort_reason_normalized(AbortReason reason) noexcept {
            return abort_reason_known(reason) ? reason : AbortReason::Custom;
        }

        inline const char *abort_reason_name(AbortReason reason) noexcept {
            switch (reason) {
            case AbortReason::MaxConnections:
                return "max connections";
            case AbortReason::CanceledBySystem:
                return "canceled by system";
            case AbortReason::Timeout:
                return "timeout";
            case AbortReason::CtsWhileDataTransfer:
                return "CTS while data transfer";
            case AbortReason::RetransmitLimitReached:
                return "retransmit limit reached";
            case AbortReason::UnexpectedDataTransfer:
                return "unexpected data transfer";
            case AbortReason::BadSequenceNumber:
                return "bad sequence number";
            case AbortReason::DuplicateSequenceNumber:
                return "duplicate sequence number";
            case AbortReason::MessageTooLarge:
                return "message too large";
            case AbortReason::Custom:
                return "custom";
            }
            return "unspecified";
        }

        // ─── Role of the node sending a connection abort (2 bits) ────────────────────
        enum class AbortSenderRole : u8 { Sender = 0b00, Receiver = 0b01, Reserved = 0b10, NotSpecified = 0b11 };

        // ─── Decode result: the untouched input comes back on failure ────────────────
        template <typename T> using Decoded = dp::Result<T, DataSpan>;

        inline constexpr u32 packets_for_size(u32 total_size) noexcept {
            return (total_size + TP_BYTES_PER_FRAME - 1) / TP_BYTES_PER_FRAME;
        }

        namespace detail {
            inline Payload cm_frame(u8 mux, PGN pgn) noexcept {
                Payload p = {};
                for (usize i = 0; i < CAN_DATA_LENGTH; ++i) {
                    p[i] = TP_RESERVED_BYTE;
                }
                p[0] = mux;
                pgn_to_wire(p.data() + 5, pgn);
                return p;
            }

            inline bool cm_matches(DataSpan raw, u8 mux, const char *what) noexcept {
                if (raw.size() != CAN_DATA_LENGTH) {
                    echo::category("j1939tp.transport.message")
                        .trace(what, " decode rejected: length=", raw.size());
                    return false;
                }
                if (raw[0] != mux) {
                    echo::category("j1939tp.transport.message")
                        .trace(what, " decode rejected: mux=", static_cast<u32>(raw[0]));
                    return false;
                }
                return true;
            }

            inline dp::Optional<u8> packet_limit_from_wire(u8 raw) noexcept {
                if (raw == TP_NO_PACKET_LIMIT)
                    return dp::nullopt;
                return raw;
            }

            inline u8 packet_limit_to_wire(const dp::Optional<u8> &limit) noexcept {
                return limit.has_value() ? limit.value() : TP_NO_PACKET_LIMIT;
            }
        } // namespace detail

        // ─── TP.CM_RTS ───────────────────────────────────────────────────────────────
        struct RequestToSend {
            static constexpr u8 MUX = tp_cm::RTS;

            u16 total_size = 0;
            u8 total_packets = 0;
            dp::Optional<u8> max_packets_per_response; // nullopt = no limit
            PGN pgn = 0;

            // Fallible constructor: derives total_packets and checks the J1939 limits
            static Result<RequestToSend> create(u16 total_size, dp::Optional<u8> max_packets_per_response, PGN pgn) {
                RequestToSend rts;
                rts.total_size = total_size;
                rts.total_packets = static_cast<u8>(packets_for_size(total_size) & 0xFF);
                rts.max_packets_per_response = max_packets_per_response;
                rts.pgn = pgn;
                auto valid = rts.validate();
                if (valid.is_err()) {
                    return Result<RequestToSend>::err(valid.error());
                }
                return Result<RequestToSend>::ok(std::move(rts));
            }

            // Re-checks the invariants, for messages that came off the wire
            Result<void> validate() const {
                if (total_size < TP_MIN_DATA_LENGTH || total_size > TP_MAX_DATA_LENGTH) {
                    return Result<void>::err(Error::invalid_parameter(
                        "total_size " + dp::String(std::to_string(total_size)) + " outside [9, 1785]"));
                }
                if (total_packets != packets_for_size(total_size)) {
                    return Result<void>::err(Error::invalid_parameter(
                        "total_packets " + dp::String(std::to_string(total_packets)) + " does not match total_size " +
                        dp::String(std::to_string(total_size))));
                }
                if (total_packets < TP_MIN_PACKETS) {
                    return Result<void>::err(Error::invalid_parameter("total_packets below 2"));
                }
                if (max_packets_per_response.has_value()) {
                    u8 limit = max_packets_per_response.value();
                    if (limit == TP_NO_PACKET_LIMIT) {
                        return Result<void>::err(Error::invalid_parameter("packet limit 255 is reserved for no limit"));
                    }
                    if (limit == 0) {
                        return Result<void>::err(Error::invalid_parameter("packet limit must be at least 1"));
                    }
                }
                if (!pgn_fits_wire(pgn)) {
                    return Result<void>::err(Error::invalid_parameter("pgn does not fit 24 bits"));
                }
                return {};
            }

            Payload encode() const noexcept {
                Payload p = detail::cm_frame(MUX, pgn);
                bitfield::pack_u16_le(p.data() + 1, total_size);
                p[3] = total_packets;
                p[4] = detail::packet_limit_to_wire(max_packets_per_response);
                return p;
            }

            static Decoded<RequestToSend> decode(DataSpan raw) {
                if (!detail::cm_matches(raw, MUX, "RTS")) {
                    return Decoded<RequestToSend>::err(raw);
                }
                RequestToSend msg;
                msg.total_size = raw.get_u16_le(1);
                msg.total_packets = raw[3];
                msg.max_packets_per_response = detail::packet_limit_from_wire(raw[4]);
                msg.pgn = pgn_from_wire(raw.data() + 5);
                return Decoded<RequestToSend>::ok(std::move(msg));
            }
        };

        // ─── TP.CM_CTS ───────────────────────────────────────────────────────────────
        struct ClearToSend {
            static constexpr u8 MUX = tp_cm::CTS;

            dp::Optional<u8> max_packets_per_response;
            u8 next_sequence = 1;
            PGN pgn = 0;

            Payload encode() const noexcept {
                Payload p = detail::cm_frame(MUX, pgn);
                p[1] = detail::packet_limit_to_wire(max_packets_per_response);
                p[2] = next_sequence;
                return p;
            }

            static Decoded<ClearToSend> decode(DataSpan raw) {
                if (!detail::cm_matches(raw, MUX, "CTS")) {
                    return Decoded<ClearToSend>::err(raw);
                }
                ClearToSend msg;
                msg.max_packets_per_response = detail::packet_limit_from_wire(raw[1]);
                msg.next_sequence = raw[2];
                msg.pgn = pgn_from_wire(raw.data() + 5);
                return Decoded<ClearToSend>::ok(std::move(msg));
            }
        };

        // ─── TP.CM_EndOfMsgAck ───────────────────────────────────────────────────────
        struct EndOfMessageAck {
            static constexpr u8 MUX = tp_cm::EOMA;

            u16 total_size = 0;
            u8 total_packets = 0;
            PGN pgn = 0;

            static EndOfMessageAck acknowledging(const RequestToSend &rts) noexcept {
                return {rts.total_size, rts.total_packets, rts.pgn};
            }

            Payload encode() const noexcept {
                Payload p = detail::cm_frame(MUX, pgn);
                bitfield::pack_u16_le(p.data() + 1, total_size);
                p[3] = total_packets;
                return p;
            }

            static Decoded<EndOfMessageAck> decode(DataSpan raw) {
                if (!detail::cm_matches(raw, MUX, "EoMA")) {
                    return Decoded<EndOfMessageAck>::err(raw);
                }
                EndOfMessageAck msg;
                msg.total_size = raw.get_u16_le(1);
                msg.total_packets = raw[3];
                msg.pgn = pgn_from_wire(raw.data() + 5);
                return Decoded<EndOfMessageAck>::ok(std::move(msg));
            }
        };

        // ─── TP.CM_BAM ───────────────────────────────────────────────────────────────
        // Same layout as EndOfMsgAck; announces a broadcast transfer with no flow control.
        struct BroadcastAnnounce {
            static constexpr u8 MUX = tp_cm::BAM;

            u16 total_size = 0;
            u8 total_packets = 0;
            PGN pgn = 0;

            Payload encode() const noexcept {
                Payload p = detail::cm_frame(MUX, pgn);
                bitfield::pack_u16_le(p.data() + 1, total_size);
                p[3] = total_packets;
                return p;
            }

            static Decoded<BroadcastAnnounce> decode(DataSpan raw) {
                if (!detail::cm_matches(raw, MUX, "BAM")) {
                    return Decoded<BroadcastAnnounce>::err(raw);
                }
                BroadcastAnnounce msg;
                msg.total_size = raw.get_u16_le(1);
                msg.total_packets = raw[3];
                msg.pgn = pgn_from_wire(raw.data() + 5);
                return Decoded<BroadcastAnnounce>::ok(std::move(msg));
            }
        };

        // ─── TP.Conn_Abort ───────────────────────────────────────────────────────────
        struct ConnectionAbort {
            static constexpr u8 MUX = tp_cm::ABORT;

            AbortReason reason = AbortReason::Custom;
            AbortSenderRole sender_role = AbortSenderRole::NotSpecified;
            PGN pgn = 0;

            Payload encode() const noexcept {
                Payload p = detail::cm_frame(MUX, pgn);
                p[1] = static_cast<u8>(reason);
                // Bits 8..3 are reserved and sent as 1s
                p[2] = bitfield::set_bits<u8>(TP_RESERVED_BYTE, 0, 2, static_cast<u8>(sender_role));
                return p;
            }

            static Decoded<ConnectionAbort> decode(DataSpan raw) {
                if (!detail::cm_matches(raw, MUX, "Abort")) {
                    return Decoded<ConnectionAbort>::err(raw);
                }
                ConnectionAbort msg;
                msg.reason = static_cast<AbortReason>(raw[1]);
                msg.sender_role = static_cast<AbortSenderRole>(bitfield::get_bits<u8>(raw[2], 0, 2));
                msg.pgn = pgn_from_wire(raw.data() + 5);
                return Decoded<ConnectionAbort>::ok(std::move(msg));
            }
        };

        // ─── TP.DT ───────────────────────────────────────────────────────────────────
        // Travels on its own PGN, so byte 0 is the sequence number, not a multiplexor.
        struct DataTransfer {
            u8 sequence = 1;
            Segment data = {};

            // Builds segment `sequence` out of a full message, padding the tail with 0xFF
            static DataTransfer from_message(u8 sequence, DataSpan message) noexcept {
                DataTransfer dt;
                dt.sequence = sequence;
                usize offset = (sequence == 0) ? message.size() : static_cast<usize>(sequence - 1) * TP_BYTES_PER_FRAME;
                for (usize i = 0; i < TP_BYTES_PER_FRAME; ++i) {
                    dt.data[i] = (offset + i < message.size()) ? message[offset + i] : TP_RESERVED_BYTE;
                }
                return dt;
            }

            Payload encode() const noexcept {
                Payload p = {};
                p[0] = sequence;
                for (usize i = 0; i < TP_BYTES_PER_FRAME; ++i) {
                    p[i + 1] = data[i];
                }
                return p;
            }

            static Decoded<DataTransfer> decode(DataSpan raw) {
                if (raw.size() != CAN_DATA_LENGTH) {
                    echo::category("j1939tp.transport.message").trace("DT decode rejected: length=", raw.size());
                    return Decoded<DataTransfer>::err(raw);
                }
                DataTransfer msg;
                msg.sequence = raw[0];
                for (usize i = 0; i < TP_BYTES_PER_FRAME; ++i) {
                    msg.data[i] = raw[i + 1];
                }
                return Decoded<DataTransfer>::ok(std::move(msg));
            }
        };

        // ─── Response to an accepted TP.DT ───────────────────────────────────────────
        struct Response {
            enum class Kind : u8 { ClearToSend, EndOfMessageAck };

            Kind kind = Kind::ClearToSend;
            ClearToSend cts;
            EndOfMessageAck eoma;

            static Response clear_to_send(ClearToSend msg) {
                Response r;
                r.kind = Kind::ClearToSend;
                r.cts = std::move(msg);
                return r;
            }

            static Response end_of_message(EndOfMessageAck msg) {
                Response r;
                r.kind = Kind::EndOfMessageAck;
                r.eoma = std::move(msg);
                return r;
            }

            bool is_cts() const noexcept { return kind == Kind::ClearToSend; }
            bool is_end() const noexcept { return kind == Kind::EndOfMessageAck; }

            Payload encode() const noexcept { return is_cts() ? cts.encode() : eoma.encode(); }
        };

        // ─── CM dispatch helper ──────────────────────────────────────────────────────
        // Identifies which TP.CM decoder applies to an 8-byte frame.
        inline dp::Optional<CmKind> peek_control_byte(DataSpan raw) noexcept {
            if (raw.size() != CAN_DATA_LENGTH)
                return dp::nullopt;
            switch (raw[0]) {
            case tp_cm::RTS:
                return CmKind::RequestToSend;
            case tp_cm::CTS:
                return CmKind::ClearToSend;
            case tp_cm::EOMA:
                return CmKind::EndOfMessageAck;
            case tp_cm::BAM:
                return CmKind::BroadcastAnnounce;
            case tp_cm::ABORT:
                return CmKind::ConnectionAbort;
            default:
                return dp::nullopt;
            }
        }

    } // namespace transport
    using namespace transport;
} // namespace j1939tp
