#include "InMemoryCredentialSource.hpp"
#include "LookoutLogging.hpp"
#include <vector>

InMemoryCredentialSource::InMemoryCredentialSource()
    : m_state(std::make_shared<State>())
{}

InMemoryCredentialSource::InMemoryCredentialSource(std::optional<Token> initial)
    : m_state(std::make_shared<State>())
{
    m_state->token = std::move(initial);
}

std::optional<CredentialSource::Token> InMemoryCredentialSource::currentCredential() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->token;
}

CredentialSource::Subscription InMemoryCredentialSource::subscribe(Listener listener) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        id = m_state->nextId++;
        m_state->listeners.emplace(id, std::move(listener));
    }
    std::weak_ptr<State> weak = m_state;
    return Subscription([weak, id]() {
        if (auto state = weak.lock()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->listeners.erase(id);
        }
    });
}

void InMemoryCredentialSource::setCredential(Token token) {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->token = token;
    }
    lLog_App("Credential updated");
    notify(token);
}

void InMemoryCredentialSource::revoke() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (!m_state->token) return;
        m_state->token.reset();
    }
    lLog_App("Credential revoked");
    notify(std::nullopt);
}

size_t InMemoryCredentialSource::listenerCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->listeners.size();
}

void InMemoryCredentialSource::notify(const std::optional<Token>& value) {
    // Copy out so listeners run without the lock held
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        listeners.reserve(m_state->listeners.size());
        for (const auto& [id, l] : m_state->listeners) listeners.push_back(l);
    }
    for (const auto& l : listeners) {
        if (l) l(value);
    }
}
