// SPDX-License-Identifier: Apache-2.0
#include "server/game/timer_queue.hpp"

namespace astro::game {

TimerQueue::Token TimerQueue::schedule_at(uint64_t due_ms, Callback cb)
{
    Token token = next_token_++;
    entries_.emplace(std::make_pair(due_ms, token), std::move(cb));
    due_by_token_.emplace(token, due_ms);
    return token;
}

bool TimerQueue::cancel(Token token)
{
    auto it = due_by_token_.find(token);
    if (it == due_by_token_.end()) {
        return false;
    }
    entries_.erase(std::make_pair(it->second, token));
    due_by_token_.erase(it);
    return true;
}

size_t TimerQueue::run_due(uint64_t now_ms)
{
    size_t ran = 0;
    while (!entries_.empty()) {
        auto first = entries_.begin();
        if (first->first.first > now_ms) {
            break;
        }
        auto node = entries_.extract(first);
        due_by_token_.erase(node.key().second);
        if (node.mapped()) {
            node.mapped()();
        }
        ++ran;
    }
    return ran;
}

void TimerQueue::clear()
{
    entries_.clear();
    due_by_token_.clear();
}

} // namespace astro::game
