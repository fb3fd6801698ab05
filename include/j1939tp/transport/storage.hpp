#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/data_span.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace j1939tp {
    namespace transport {

        // ─── Where reassembled bytes accumulate ──────────────────────────────────────
        enum class StorageKind : u8 {
            Growable, // owned vector, appended per segment
            Fixed     // caller-supplied region, no allocation
        };

        // ─── Reassembly buffer ───────────────────────────────────────────────────────
        // Receives each accepted TP.DT segment exactly once, in sequence order.
        // A fixed region is addressed in 7-byte windows by (sequence - 1) and must
        // outlive the buffer; only the bytes of the declared message are stored, so
        // a region of exactly total_size bytes is enough.
        class ReassemblyBuffer {
            StorageKind kind_ = StorageKind::Growable;
            dp::Vector<u8> owned_;
            u8 *region_ = nullptr;
            usize region_size_ = 0;
            usize total_size_ = 0;

            ReassemblyBuffer(StorageKind kind, u8 *region, usize region_size) noexcept
                : kind_(kind), region_(region), region_size_(region_size) {}

          public:
            ReassemblyBuffer() = default;

            static ReassemblyBuffer growable() noexcept { return ReassemblyBuffer(StorageKind::Growable, nullptr, 0); }

            static ReassemblyBuffer fixed(u8 *region, usize size) noexcept {
                return ReassemblyBuffer(StorageKind::Fixed, region, region == nullptr ? 0 : size);
            }

            template <usize N> static ReassemblyBuffer fixed(dp::Array<u8, N> &region) noexcept {
                return fixed(region.data(), N);
            }

            static ReassemblyBuffer fixed(dp::Vector<u8> &region) noexcept { return fixed(region.data(), region.size()); }

            StorageKind kind() const noexcept { return kind_; }

            // Whole 7-byte windows in the region. A transfer can still fit with one
            // window fewer, since its last window only needs the message tail.
            usize capacity_segments() const noexcept {
                if (kind_ == StorageKind::Growable)
                    return TP_MAX_PACKETS;
                return region_size_ / TP_BYTES_PER_FRAME;
            }

            bool fits(usize total_size) const noexcept {
                if (kind_ == StorageKind::Growable)
                    return total_size <= TP_MAX_DATA_LENGTH;
                return total_size <= region_size_;
            }

            usize region_size() const noexcept { return region_size_; }

            // Called once by the session before the first segment
            void begin(usize total_size) {
                total_size_ = total_size;
                owned_.clear();
            }

            // ─── Store bytes for segment `sequence` ──────────────────────────────────
            Result<void> write_segment(u8 sequence, DataSpan segment) {
                if (sequence == 0 || segment.size() != TP_BYTES_PER_FRAME) {
                    return Result<void>::err(Error::invalid_state("segment must be 7 bytes with sequence >= 1"));
                }
                usize offset = static_cast<usize>(sequence - 1) * TP_BYTES_PER_FRAME;

                if (kind_ == StorageKind::Growable) {
                    if (owned_.size() != offset) {
                        return Result<void>::err(Error::invalid_state("growable storage written out of order"));
                    }
                    owned_.insert(owned_.end(), segment.begin(), segment.end());
                    return {};
                }

                // Bytes of this window that belong to the message (the rest is padding)
                usize needed = TP_BYTES_PER_FRAME;
                if (total_size_ > offset && total_size_ - offset < needed) {
                    needed = total_size_ - offset;
                }
                if (offset >= region_size_ || region_size_ - offset < needed) {
                    echo::category("j1939tp.transport.storage")
                        .warn("fixed storage exhausted: seq=", static_cast<u32>(sequence), " region=", region_size_,
                              " bytes");
                    return Result<void>::err(Error::storage_too_small(sequence));
                }
                for (usize i = 0; i < needed; ++i) {
                    region_[offset + i] = segment[i];
                }
                return {};
            }

            // Drops the final segment's padding
            void finish() {
                if (kind_ == StorageKind::Growable && owned_.size() > total_size_) {
                    owned_.resize(total_size_);
                }
            }

            DataSpan view() const noexcept {
                if (kind_ == StorageKind::Growable)
                    return DataSpan(owned_).subspan(0, total_size_);
                usize size = total_size_ < region_size_ ? total_size_ : region_size_;
                return DataSpan(region_, size);
            }
        };

    } // namespace transport
    using namespace transport;
} // namespace j1939tp
