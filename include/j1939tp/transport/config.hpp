#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace j1939tp {
    namespace transport {

        // ─── Receiver-side session configuration ─────────────────────────────────────
        struct SessionConfig {
            // Caps the burst the receiver grants per CTS. nullopt keeps the sender's
            // RTS value (or unlimited streaming when the RTS sets no limit).
            dp::Optional<u8> max_packets_per_cts;

            // Fluent API
            SessionConfig &set_max_packets_per_cts(u8 n) {
                max_packets_per_cts = n;
                return *this;
            }
            SessionConfig &clear_max_packets_per_cts() {
                max_packets_per_cts = dp::nullopt;
                return *this;
            }
        };

        // ─── Validation result ──────────────────────────────────────────────────────
        struct SessionConfigValidation {
            bool packet_limit_ok = false;
            bool overall_ok = false;
            dp::String error_message;
        };

        inline SessionConfigValidation validate_session_config(const SessionConfig &config) {
            SessionConfigValidation result;
            result.packet_limit_ok =
                !config.max_packets_per_cts.has_value() ||
                (config.max_packets_per_cts.value() >= 1 && config.max_packets_per_cts.value() < TP_MAX_PACKETS);
            result.overall_ok = result.packet_limit_ok;

            if (!result.packet_limit_ok) {
                result.error_message = "max_packets_per_cts must be 1..254";
            }

            if (!result.overall_ok) {
                echo::category("j1939tp.config").warn("session config rejected: ", result.error_message);
            }
            return result;
        }

        inline Result<void> enforce_session_config(const SessionConfig &config) {
            auto validation = validate_session_config(config);
            if (!validation.overall_ok) {
                return Result<void>::err(Error::invalid_parameter(validation.error_message));
            }
            return {};
        }

    } // namespace transport
    using namespace transport;
} // namespace j1939tp
