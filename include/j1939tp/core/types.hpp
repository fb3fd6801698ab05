#pragma once

#include <datapod/datapod.hpp>

namespace j1939tp {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Byte type alias ────────────────────────────────────────────────────────
    using dp::byte;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using PGN = u32;

    // One CAN data field: every TP.CM and TP.DT message occupies exactly this
    using Payload = dp::Array<u8, 8>;

    // One TP.DT segment, without its sequence byte
    using Segment = dp::Array<u8, 7>;

} // namespace j1939tp
