#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: state_machine.hpp
    MODULE: logic
    PURPOSE: Enum-keyed state machine with explicitly declared edges.
            A transition that was never declared is rejected, so one-way flows
            (e.g. placement -> playing) cannot be re-entered.
*/


#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace mxr
{
    template <typename TStateId, typename TContext>
    class StateMachine
    {
    public:
        using StateId = TStateId;

        struct StateCallbacks
        {
            std::function<void(TContext&, StateId from)> on_enter{};
            std::function<void(TContext&, double dt, double elapsed)> on_update{};
            std::function<void(TContext&, StateId to)> on_exit{};
        };

        struct Edge
        {
            StateId from{};
            StateId to{};
            // Optional; an empty guard always allows the edge.
            std::function<bool(const TContext&)> guard{};
        };

        bool add_state(StateId id, StateCallbacks callbacks = {})
        {
            if (find_state_index(id).has_value()) return false;
            states_.push_back(StateEntry{id, std::move(callbacks)});
            return true;
        }

        bool has_state(StateId id) const
        {
            return find_state_index(id).has_value();
        }

        bool add_edge(StateId from, StateId to, std::function<bool(const TContext&)> guard = {})
        {
            if (!has_state(from) || !has_state(to)) return false;
            if (find_edge(from, to)) return false;
            edges_.push_back(Edge{from, to, std::move(guard)});
            return true;
        }

        bool start(StateId initial_state, TContext& ctx)
        {
            if (started_ || !has_state(initial_state)) return false;
            started_ = true;
            current_state_ = initial_state;
            state_time_ = 0.0;
            call_on_enter(ctx, initial_state, initial_state);
            return true;
        }

        bool started() const
        {
            return started_;
        }

        std::optional<StateId> current_state() const
        {
            if (!started_) return std::nullopt;
            return current_state_;
        }

        bool in_state(StateId id) const
        {
            return started_ && current_state_ == id;
        }

        double state_time() const
        {
            return state_time_;
        }

        bool can_transition(StateId to, const TContext& ctx) const
        {
            if (!started_) return false;
            const Edge* edge = find_edge(current_state_, to);
            if (!edge) return false;
            return !edge->guard || edge->guard(ctx);
        }

        // Leaves the current state through a declared edge. Returns false when no
        // such edge exists or its guard refuses.
        bool transition_to(StateId to, TContext& ctx)
        {
            if (!can_transition(to, ctx)) return false;
            const StateId from = current_state_;
            call_on_exit(ctx, from, to);
            current_state_ = to;
            state_time_ = 0.0;
            call_on_enter(ctx, to, from);
            return true;
        }

        void tick(TContext& ctx, double dt)
        {
            if (!started_) return;
            const double clamped_dt = dt > 0.0 ? dt : 0.0;
            call_on_update(ctx, current_state_, clamped_dt, state_time_);
            state_time_ += clamped_dt;
        }

    private:
        struct StateEntry
        {
            StateId id{};
            StateCallbacks callbacks{};
        };

        std::optional<std::size_t> find_state_index(StateId id) const
        {
            for (std::size_t i = 0; i < states_.size(); ++i)
            {
                if (states_[i].id == id) return i;
            }
            return std::nullopt;
        }

        const Edge* find_edge(StateId from, StateId to) const
        {
            for (const Edge& e : edges_)
            {
                if (e.from == from && e.to == to) return &e;
            }
            return nullptr;
        }

        StateCallbacks* find_callbacks(StateId id)
        {
            const auto idx = find_state_index(id);
            if (!idx.has_value()) return nullptr;
            return &states_[*idx].callbacks;
        }

        void call_on_enter(TContext& ctx, StateId id, StateId from)
        {
            StateCallbacks* cb = find_callbacks(id);
            if (!cb || !cb->on_enter) return;
            cb->on_enter(ctx, from);
        }

        void call_on_update(TContext& ctx, StateId id, double dt, double elapsed)
        {
            StateCallbacks* cb = find_callbacks(id);
            if (!cb || !cb->on_update) return;
            cb->on_update(ctx, dt, elapsed);
        }

        void call_on_exit(TContext& ctx, StateId id, StateId to)
        {
            StateCallbacks* cb = find_callbacks(id);
            if (!cb || !cb->on_exit) return;
            cb->on_exit(ctx, to);
        }

        std::vector<StateEntry> states_{};
        std::vector<Edge> edges_{};
        bool started_ = false;
        StateId current_state_{};
        double state_time_ = 0.0;
    };
}
