#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace j1939tp {
    namespace util {

        // ─── Listener token for unsubscription ────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Session notification dispatcher ─────────────────────────────────────────
        // Listeners run synchronously inside the session transition that fires them.
        // A listener may unsubscribe itself (or another) while an emit is running;
        // the entry is dropped once the emit returns.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = INVALID_TOKEN;
                std::function<void(Args...)> fn;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            usize emit_depth_ = 0;

            void compact() {
                for (auto it = listeners_.begin(); it != listeners_.end();) {
                    if (it->token == INVALID_TOKEN) {
                        it = listeners_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn)});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                if (token == INVALID_TOKEN)
                    return false;
                for (auto &listener : listeners_) {
                    if (listener.token == token) {
                        listener.token = INVALID_TOKEN;
                        if (emit_depth_ == 0)
                            compact();
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) {
                ++emit_depth_;
                // A listener may subscribe during dispatch and grow the vector, so
                // iterate by index and call a copy of the stored function
                for (usize i = 0; i < listeners_.size(); ++i) {
                    if (listeners_[i].token != INVALID_TOKEN && listeners_[i].fn) {
                        auto fn = listeners_[i].fn;
                        fn(args...);
                    }
                }
                --emit_depth_;
                if (emit_depth_ == 0)
                    compact();
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (l.token != INVALID_TOKEN)
                        ++active;
                }
                return active;
            }

            void clear() { listeners_.clear(); }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace j1939tp
