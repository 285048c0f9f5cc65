/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "sim/TimerRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace LatticeEngine {

void TimerRegistry::set(const TimedEventPtr& event, int ticks) {
    if (!event) {
        TIMER_ERROR("Attempted to set a timer for a null TimedEvent");
        throw std::invalid_argument(
            "Lattice Engine - Attempted to set a timer for a null TimedEvent");
    }

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const Entry& e) { return e.event == event; });

    if (ticks < 0) {
        if (it != m_entries.end()) {
            m_entries.erase(it);
        }
        return;
    }

    if (it != m_entries.end()) {
        it->remaining = ticks;
        it->fired = false;
    } else {
        m_entries.push_back(Entry{event, ticks, false});
    }
}

int TimerRegistry::get(const TimedEventPtr& event) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const Entry& e) { return e.event == event; });
    return it != m_entries.end() ? it->remaining : -1;
}

void TimerRegistry::advance(std::vector<TimedEventPtr>& due) {
    auto out = m_entries.begin();
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->remaining == 0) {
            // Set to 0 since the last sweep, or already fired last pass
            if (!it->fired) {
                due.push_back(it->event);
            }
            continue;
        }
        --it->remaining;
        if (it->remaining == 0) {
            due.push_back(it->event);
            it->fired = true;
        }
        if (out != it) {
            *out = std::move(*it);
        }
        ++out;
    }
    m_entries.erase(out, m_entries.end());
}

void TimerRegistry::collectExpired(std::vector<TimedEventPtr>& due) {
    auto out = m_entries.begin();
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->remaining == 0 && !it->fired) {
            due.push_back(it->event);
            continue;
        }
        if (out != it) {
            *out = std::move(*it);
        }
        ++out;
    }
    m_entries.erase(out, m_entries.end());
}

} // namespace LatticeEngine
