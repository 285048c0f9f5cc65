/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TIMER_REGISTRY_HPP
#define TIMER_REGISTRY_HPP

#include <boost/container/small_vector.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace LatticeEngine {

/**
 * @brief Zero-argument callback fired when a node's timer runs out
 *
 * Timers are keyed by the TimedEvent object itself, so the same event can run
 * on several nodes with independent countdowns.
 */
class TimedEvent {
public:
    using Action = std::function<void()>;

    explicit TimedEvent(Action action, std::string name = "TimedEvent")
        : m_action(std::move(action)), m_name(std::move(name)) {}

    void fire() const {
        if (m_action) {
            m_action();
        }
    }

    const std::string& getName() const { return m_name; }

private:
    Action m_action;
    std::string m_name;
};

using TimedEventPtr = std::shared_ptr<TimedEvent>;

/**
 * @brief Per-node mapping from timed event to remaining ticks
 *
 * A timer value of n > 0 fires in n tick passes, 0 fires at the next
 * processing point, and an absent entry is inactive. Entries keep their
 * registration order, which is also the order due events fire in.
 */
class TimerRegistry {
public:
    /**
     * @brief Sets the remaining ticks for an event
     * @param event Event to time, must not be null
     * @param ticks Remaining ticks; negative removes the timer
     * @throws std::invalid_argument if event is null
     */
    void set(const TimedEventPtr& event, int ticks);

    /**
     * @return Remaining ticks for event, or -1 if its timer is not running.
     *         A timer that fired this pass reads 0 until the next sweep.
     */
    int get(const TimedEventPtr& event) const;

    /**
     * @brief Tick sweep: removes zero entries, decrements the rest
     *
     * Events that were set to 0 or reach 0 by decrementing are appended to
     * due in the order they were encountered; each timer fires once. Nothing
     * fires here, so the caller can run callbacks after the registry is
     * consistent again.
     */
    void advance(std::vector<TimedEventPtr>& due);

    /**
     * @brief Removes entries set to 0 that have not fired yet
     *
     * Used after a node's tick hook so timers set to 0 during the hook fire
     * in the same pass.
     */
    void collectExpired(std::vector<TimedEventPtr>& due);

    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }
    void clear() { m_entries.clear(); }

private:
    struct Entry {
        TimedEventPtr event;
        int remaining;
        bool fired; // reached 0 by counting down; dropped at the next sweep
    };

    // Most nodes run a handful of timers at most
    boost::container::small_vector<Entry, 4> m_entries{};
};

} // namespace LatticeEngine

#endif // TIMER_REGISTRY_HPP
