/// @file play_handle.hpp
/// @brief Deferred result of SoundAsset::play

#pragma once

#include "fwd.hpp"

#include <tonic/core/error.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace tonic_sound {

/// Shared handle that settles exactly once: resolved with an instance or
/// rejected with an error. Copies observe the same state.
class PlayHandle {
public:
    enum class Status { Pending, Resolved, Rejected };

    using ResolvedFn = std::function<void(const InstancePtr&)>;
    using RejectedFn = std::function<void(const tonic_core::Error&)>;

    /// A new pending handle
    PlayHandle();

    [[nodiscard]] static PlayHandle resolved(InstancePtr instance);
    [[nodiscard]] static PlayHandle rejected(tonic_core::Error error);

    [[nodiscard]] Status status() const { return m_state->status; }
    [[nodiscard]] bool is_pending() const { return m_state->status == Status::Pending; }
    [[nodiscard]] bool is_resolved() const { return m_state->status == Status::Resolved; }
    [[nodiscard]] bool is_rejected() const { return m_state->status == Status::Rejected; }

    /// Instance once resolved, otherwise null
    [[nodiscard]] InstancePtr instance() const { return m_state->instance; }

    /// Error once rejected, otherwise null
    [[nodiscard]] const tonic_core::Error* error() const;

    /// Register continuations; run immediately if already settled
    void then(ResolvedFn on_resolved, RejectedFn on_rejected = {}) const;

    /// Settle the handle. Returns false if it was already settled.
    bool resolve(InstancePtr instance) const;
    bool reject(tonic_core::Error error) const;

    [[nodiscard]] bool same_as(const PlayHandle& other) const { return m_state == other.m_state; }

private:
    struct State {
        Status status = Status::Pending;
        InstancePtr instance;
        std::optional<tonic_core::Error> error;
        std::vector<std::pair<ResolvedFn, RejectedFn>> continuations;
    };

    std::shared_ptr<State> m_state;
};

} // namespace tonic_sound
