#pragma once

#include "../core/types.hpp"
#include <type_traits>

namespace j1939tp {
    namespace util {

        // ─── Bit-level access helpers ────────────────────────────────────────────────
        namespace bitfield {

            // Constrain to unsigned integer types to avoid UB with signed shifts
            template <typename T>
            concept UnsignedInt = std::is_unsigned_v<T>;

            template <UnsignedInt T> constexpr T get_bits(T value, u8 start_bit, u8 length) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (length == 0 || start_bit >= bit_width) {
                    return 0;
                }
                if (length >= bit_width) {
                    return value >> start_bit;
                }
                T mask = (static_cast<T>(1) << length) - 1;
                return (value >> start_bit) & mask;
            }

            template <UnsignedInt T> constexpr T set_bits(T value, u8 start_bit, u8 length, T field_value) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (length == 0 || start_bit >= bit_width) {
                    return value;
                }
                if (length >= bit_width) {
                    return field_value;
                }
                T mask = (static_cast<T>(1) << length) - 1;
                value &= static_cast<T>(~(mask << start_bit));
                value |= static_cast<T>((field_value & mask) << start_bit);
                return value;
            }

            // Pack/unpack little-endian values from byte arrays
            inline u16 unpack_u16_le(const u8 *data) noexcept {
                return static_cast<u16>(data[0]) | (static_cast<u16>(data[1]) << 8);
            }

            // 24-bit fields carry the PGN in every TP.CM message
            inline u32 unpack_u24_le(const u8 *data) noexcept {
                return static_cast<u32>(data[0]) | (static_cast<u32>(data[1]) << 8) |
                       (static_cast<u32>(data[2]) << 16);
            }

            inline void pack_u16_le(u8 *data, u16 value) noexcept {
                data[0] = static_cast<u8>(value & 0xFF);
                data[1] = static_cast<u8>((value >> 8) & 0xFF);
            }

            inline void pack_u24_le(u8 *data, u32 value) noexcept {
                data[0] = static_cast<u8>(value & 0xFF);
                data[1] = static_cast<u8>((value >> 8) & 0xFF);
                data[2] = static_cast<u8>((value >> 16) & 0xFF);
            }

        } // namespace bitfield
    } // namespace util
    using namespace util;
} // namespace j1939tp
