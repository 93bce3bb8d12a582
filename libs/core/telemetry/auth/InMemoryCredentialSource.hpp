#pragma once
#include "CredentialSource.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

// Credential holder fed by the embedding application (login, logout,
// token refresh). Subscriptions stay valid to destroy after the source is gone.
class InMemoryCredentialSource : public CredentialSource {
public:
    InMemoryCredentialSource();
    explicit InMemoryCredentialSource(std::optional<Token> initial);

    std::optional<Token> currentCredential() const override;
    [[nodiscard]] Subscription subscribe(Listener listener) override;

    /// Store a token and notify listeners (also when it replaces another token).
    void setCredential(Token token);
    /// Drop the token and notify listeners. No-op if already empty.
    void revoke();

    size_t listenerCount() const;

private:
    struct State {
        mutable std::mutex mutex;
        std::optional<Token> token;
        std::map<uint64_t, Listener> listeners;
        uint64_t nextId = 1;
    };
    std::shared_ptr<State> m_state;

    void notify(const std::optional<Token>& value);
};
