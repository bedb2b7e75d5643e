// SPDX-License-Identifier: Apache-2.0
// timer_queue.hpp - Deferred callbacks driven by the simulation clock.
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace astro::game {

class TimerQueue
{
public:
    using Token = uint64_t;
    using Callback = std::function<void()>;

    Token schedule_at(uint64_t due_ms, Callback cb);
    // Returns false when the token already fired or was cancelled.
    bool cancel(Token token);
    // Runs every callback due at or before now_ms, earliest first. Callbacks may schedule or cancel.
    size_t run_due(uint64_t now_ms);
    void clear();
    size_t pending() const { return entries_.size(); }

private:
    std::map<std::pair<uint64_t, Token>, Callback> entries_;
    std::unordered_map<Token, uint64_t> due_by_token_;
    Token next_token_{1};
};

} // namespace astro::game
