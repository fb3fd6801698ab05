#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "j1939tp/core/constants.hpp"
#include "j1939tp/core/error.hpp"
#include "j1939tp/core/pgn.hpp"
#include "j1939tp/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "j1939tp/util/bitfield.hpp"
#include "j1939tp/util/data_span.hpp"
#include "j1939tp/util/event.hpp"

// ─── Transport (J1939-21 TP receiver) ────────────────────────────────────────
#include "j1939tp/transport/config.hpp"
#include "j1939tp/transport/message.hpp"
#include "j1939tp/transport/session.hpp"
#include "j1939tp/transport/storage.hpp"
