#pragma once

#include "types.hpp"

namespace j1939tp {

    // ─── Transport PGNs (J1939-21) ───────────────────────────────────────────────
    inline constexpr PGN PGN_TP_CM = 0xEC00;
    inline constexpr PGN PGN_TP_DT = 0xEB00;

    // ─── Protocol limits ─────────────────────────────────────────────────────────
    inline constexpr u32 CAN_DATA_LENGTH = 8;
    inline constexpr u32 TP_BYTES_PER_FRAME = 7;
    inline constexpr u32 TP_MIN_DATA_LENGTH = 9;
    inline constexpr u32 TP_MAX_DATA_LENGTH = 1785;
    inline constexpr u32 TP_MIN_PACKETS = 2;
    inline constexpr u32 TP_MAX_PACKETS = 255;

    // 0xFF in a packets-per-CTS field means "no limit"
    inline constexpr u8 TP_NO_PACKET_LIMIT = 0xFF;

    // Unused bytes in TP.CM frames and padding in the final TP.DT segment
    inline constexpr u8 TP_RESERVED_BYTE = 0xFF;

    // Content identifiers travel as 3 little-endian bytes
    inline constexpr PGN PGN_WIRE_MASK = 0xFFFFFF;

} // namespace j1939tp
