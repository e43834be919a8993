/// @file play_handle.cpp
/// @brief PlayHandle implementation

#include <tonic/sound/play_handle.hpp>
#include <tonic/sound/instance.hpp>

namespace tonic_sound {

PlayHandle::PlayHandle()
    : m_state(std::make_shared<State>()) {}

PlayHandle PlayHandle::resolved(InstancePtr instance) {
    PlayHandle handle;
    handle.resolve(std::move(instance));
    return handle;
}

PlayHandle PlayHandle::rejected(tonic_core::Error error) {
    PlayHandle handle;
    handle.reject(std::move(error));
    return handle;
}

const tonic_core::Error* PlayHandle::error() const {
    return m_state->error ? &*m_state->error : nullptr;
}

void PlayHandle::then(ResolvedFn on_resolved, RejectedFn on_rejected) const {
    switch (m_state->status) {
        case Status::Resolved:
            if (on_resolved) on_resolved(m_state->instance);
            break;
        case Status::Rejected:
            if (on_rejected) on_rejected(*m_state->error);
            break;
        case Status::Pending:
            m_state->continuations.emplace_back(std::move(on_resolved), std::move(on_rejected));
            break;
    }
}

bool PlayHandle::resolve(InstancePtr instance) const {
    if (m_state->status != Status::Pending) return false;

    m_state->status = Status::Resolved;
    m_state->instance = std::move(instance);

    auto continuations = std::move(m_state->continuations);
    m_state->continuations.clear();
    for (auto& [on_resolved, on_rejected] : continuations) {
        if (on_resolved) on_resolved(m_state->instance);
    }
    return true;
}

bool PlayHandle::reject(tonic_core::Error error) const {
    if (m_state->status != Status::Pending) return false;

    m_state->status = Status::Rejected;
    m_state->error = std::move(error);

    auto continuations = std::move(m_state->continuations);
    m_state->continuations.clear();
    for (auto& [on_resolved, on_rejected] : continuations) {
        if (on_rejected) on_rejected(*m_state->error);
    }
    return true;
}

} // namespace tonic_sound
