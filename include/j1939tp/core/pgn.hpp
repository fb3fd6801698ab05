#pragma once

#include "constants.hpp"
#include "types.hpp"
#include "../util/bitfield.hpp"

namespace j1939tp {

    // ─── Content identifier wire form ────────────────────────────────────────────
    // The transport never interprets the PGN it carries. It only moves the low
    // 24 bits on and off the wire, so any value below 2^24 survives a round-trip.

    inline void pgn_to_wire(u8 *data, PGN pgn) noexcept { bitfield::pack_u24_le(data, pgn & PGN_WIRE_MASK); }

    inline PGN pgn_from_wire(const u8 *data) noexcept { return bitfield::unpack_u24_le(data); }

    inline bool pgn_fits_wire(PGN pgn) noexcept { return (pgn & ~PGN_WIRE_MASK) == 0; }

} // namespace j1939tp
