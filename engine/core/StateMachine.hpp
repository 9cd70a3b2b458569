#pragma once

/**
 * @file StateMachine.hpp
 * @brief Hierarchical finite state machine driven by enum triggers
 *
 * States are configured fluently:
 * @code
 * fsm.Configure(State::Idle)
 *     .Permit(Trigger::Go, State::Running)
 *     .Ignore(Trigger::Stop)
 *     .OnEntry([&] { ... });
 * @endcode
 *
 * Substates inherit the trigger handlers of their superstates. A trigger
 * fired from inside an entry, exit or internal action is queued and handled
 * once the current transition has completed.
 */

#include "core/Logger.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace Lodestone {

template <typename TState, typename TTrigger>
class StateMachine {
public:
    using Action = std::function<void()>;
    using Guard = std::function<bool()>;
    using TransitionCallback = std::function<void(TState from, TState to, TTrigger trigger)>;
    using UnhandledCallback = std::function<void(TState state, TTrigger trigger)>;

private:
    enum class HandlerKind : uint8_t {
        Transition,
        Ignore,
        Internal
    };

    struct Handler {
        HandlerKind kind = HandlerKind::Ignore;
        TState destination{};
        Guard guard;
        Action action;

        [[nodiscard]] bool IsAllowed() const { return !guard || guard(); }
    };

    struct StateRepresentation {
        std::optional<TState> superstate;
        std::map<TTrigger, std::vector<Handler>> handlers;
        std::vector<Action> entryActions;
        std::vector<Action> exitActions;
    };

public:
    /**
     * @brief Fluent configuration handle for one state
     */
    class StateConfiguration {
    public:
        StateConfiguration& SubstateOf(TState superstate) {
            m_machine->Representation(superstate);
            m_machine->Representation(m_state).superstate = superstate;
            return *this;
        }

        StateConfiguration& Permit(TTrigger trigger, TState destination) {
            return PermitIf(trigger, destination, nullptr);
        }

        StateConfiguration& PermitIf(TTrigger trigger, TState destination, Guard guard) {
            Handler handler;
            handler.kind = HandlerKind::Transition;
            handler.destination = destination;
            handler.guard = std::move(guard);
            m_machine->Representation(destination);
            Add(trigger, std::move(handler));
            return *this;
        }

        StateConfiguration& PermitReentry(TTrigger trigger) {
            return Permit(trigger, m_state);
        }

        StateConfiguration& Ignore(TTrigger trigger) {
            Handler handler;
            handler.kind = HandlerKind::Ignore;
            Add(trigger, std::move(handler));
            return *this;
        }

        StateConfiguration& InternalTransition(TTrigger trigger, Action action) {
            Handler handler;
            handler.kind = HandlerKind::Internal;
            handler.action = std::move(action);
            Add(trigger, std::move(handler));
            return *this;
        }

        StateConfiguration& OnEntry(Action action) {
            m_machine->Representation(m_state).entryActions.push_back(std::move(action));
            return *this;
        }

        StateConfiguration& OnExit(Action action) {
            m_machine->Representation(m_state).exitActions.push_back(std::move(action));
            return *this;
        }

    private:
        friend class StateMachine;

        StateConfiguration(StateMachine* machine, TState state)
            : m_machine(machine), m_state(state) {}

        void Add(TTrigger trigger, Handler handler) {
            m_machine->Representation(m_state).handlers[trigger].push_back(std::move(handler));
        }

        StateMachine* m_machine;
        TState m_state;
    };

    explicit StateMachine(TState initial) : m_state(initial) {
        Representation(initial);
    }

    // Non-copyable: configured actions capture their owner
    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    StateConfiguration Configure(TState state) {
        Representation(state);
        return StateConfiguration(this, state);
    }

    [[nodiscard]] TState GetState() const { return m_state; }

    /**
     * @brief True if the current state is @p state or one of its substates
     */
    [[nodiscard]] bool IsInState(TState state) const {
        return Includes(state, m_state);
    }

    /**
     * @brief True if some handler in the current state hierarchy accepts the trigger
     */
    [[nodiscard]] bool CanFire(TTrigger trigger) const {
        return FindHandler(trigger) != nullptr;
    }

    [[nodiscard]] bool IsFiring() const { return m_firing; }

    /**
     * @brief Handle a trigger, or queue it if a transition is in progress
     */
    void Fire(TTrigger trigger) {
        m_queue.push_back(trigger);
        if (m_firing) {
            return;
        }

        m_firing = true;
        try {
            while (!m_queue.empty()) {
                TTrigger next = m_queue.front();
                m_queue.pop_front();
                Process(next);
            }
        } catch (...) {
            m_firing = false;
            m_queue.clear();
            throw;
        }
        m_firing = false;
    }

    void SetOnTransitioned(TransitionCallback callback) { m_onTransitioned = std::move(callback); }
    void SetOnUnhandledTrigger(UnhandledCallback callback) { m_onUnhandled = std::move(callback); }

private:
    StateRepresentation& Representation(TState state) {
        return m_states[state];
    }

    [[nodiscard]] const StateRepresentation* Find(TState state) const {
        auto it = m_states.find(state);
        return it != m_states.end() ? &it->second : nullptr;
    }

    [[nodiscard]] std::optional<TState> SuperstateOf(TState state) const {
        const StateRepresentation* rep = Find(state);
        return rep ? rep->superstate : std::nullopt;
    }

    /**
     * @brief True if @p candidate is @p state or nested anywhere below it
     */
    [[nodiscard]] bool Includes(TState state, TState candidate) const {
        std::optional<TState> current = candidate;
        while (current) {
            if (*current == state) {
                return true;
            }
            current = SuperstateOf(*current);
        }
        return false;
    }

    /**
     * @brief First handler whose guard passes, searching from the current state upwards
     */
    [[nodiscard]] const Handler* FindHandler(TTrigger trigger) const {
        std::optional<TState> current = m_state;
        while (current) {
            const StateRepresentation* rep = Find(*current);
            if (!rep) {
                break;
            }
            auto it = rep->handlers.find(trigger);
            if (it != rep->handlers.end()) {
                for (const Handler& handler : it->second) {
                    if (handler.IsAllowed()) {
                        return &handler;
                    }
                }
            }
            current = rep->superstate;
        }
        return nullptr;
    }

    void Process(TTrigger trigger) {
        const Handler* handler = FindHandler(trigger);
        if (!handler) {
            if (m_onUnhandled) {
                m_onUnhandled(m_state, trigger);
            } else {
                LODESTONE_LOG_WARN("StateMachine: no handler for trigger {} in state {}",
                                   static_cast<int>(trigger), static_cast<int>(m_state));
            }
            return;
        }

        switch (handler->kind) {
            case HandlerKind::Ignore:
                break;
            case HandlerKind::Internal:
                if (handler->action) {
                    // Copied so the action may reconfigure this state
                    Action action = handler->action;
                    action();
                }
                break;
            case HandlerKind::Transition:
                Transition(handler->destination, trigger);
                break;
        }
    }

    void Transition(TState destination, TTrigger trigger) {
        const TState source = m_state;
        const bool reentry = source == destination;

        Exit(source, destination, reentry);
        m_state = destination;

        if (m_onTransitioned) {
            m_onTransitioned(source, destination, trigger);
        }

        Enter(destination, source, reentry);
    }

    void Exit(TState state, TState destination, bool reentry) {
        if (reentry) {
            RunActions(Find(state)->exitActions);
            return;
        }
        if (Includes(state, destination)) {
            return;
        }
        RunActions(Find(state)->exitActions);
        if (std::optional<TState> parent = SuperstateOf(state)) {
            Exit(*parent, destination, false);
        }
    }

    void Enter(TState state, TState source, bool reentry) {
        if (reentry) {
            RunActions(Find(state)->entryActions);
            return;
        }
        if (Includes(state, source)) {
            return;
        }
        if (std::optional<TState> parent = SuperstateOf(state)) {
            Enter(*parent, source, false);
        }
        RunActions(Find(state)->entryActions);
    }

    static void RunActions(const std::vector<Action>& actions) {
        for (const Action& action : actions) {
            if (action) {
                action();
            }
        }
    }

    TState m_state;
    std::map<TState, StateRepresentation> m_states;
    std::deque<TTrigger> m_queue;
    bool m_firing = false;

    TransitionCallback m_onTransitioned;
    UnhandledCallback m_onUnhandled;
};

} // namespace Lodestone
