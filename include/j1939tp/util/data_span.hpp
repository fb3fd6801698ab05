#pragma once

#include "../core/types.hpp"
#include "../util/bitfield.hpp"
#include <datapod/datapod.hpp>

namespace j1939tp {
    namespace util {

        // ─── Span-like view over raw frame or payload bytes ──────────────────────────
        class DataSpan {
            const u8 *data_ = nullptr;
            usize size_ = 0;

          public:
            constexpr DataSpan() = default;
            constexpr DataSpan(const u8 *data, usize size) : data_(data), size_(size) {}
            DataSpan(const dp::Vector<u8> &vec) : data_(vec.data()), size_(vec.size()) {}

            template <usize N> constexpr DataSpan(const dp::Array<u8, N> &arr) : data_(arr.data()), size_(N) {}

            constexpr const u8 *data() const noexcept { return data_; }
            constexpr usize size() const noexcept { return size_; }
            constexpr bool empty() const noexcept { return size_ == 0; }

            constexpr u8 operator[](usize idx) const noexcept {
                if (idx >= size_)
                    return 0xFF;
                return data_[idx];
            }

            constexpr DataSpan subspan(usize offset, usize count = static_cast<usize>(-1)) const noexcept {
                if (offset >= size_)
                    return {};
                usize actual = (count > size_ - offset) ? (size_ - offset) : count;
                return DataSpan(data_ + offset, actual);
            }

            // ─── Typed extraction ────────────────────────────────────────────────────
            u8 get_u8(usize offset) const noexcept { return (*this)[offset]; }

            u16 get_u16_le(usize offset) const noexcept {
                if (offset + 1 >= size_)
                    return 0xFFFF;
                return bitfield::unpack_u16_le(data_ + offset);
            }

            u32 get_u24_le(usize offset) const noexcept {
                if (offset + 2 >= size_)
                    return 0xFFFFFF;
                return bitfield::unpack_u24_le(data_ + offset);
            }

            // Same length and same bytes
            bool equals(DataSpan other) const noexcept {
                if (other.size_ != size_)
                    return false;
                for (usize i = 0; i < size_; ++i) {
                    if (data_[i] != other.data_[i])
                        return false;
                }
                return true;
            }

            dp::Vector<u8> to_vector() const { return dp::Vector<u8>(begin(), end()); }

            // Iterator support
            constexpr const u8 *begin() const noexcept { return data_; }
            constexpr const u8 *end() const noexcept { return data_ + size_; }
        };

    } // namespace util
    using namespace util;
} // namespace j1939tp
