/*
Lookout — CredentialSource
Role: The session credential collaborator. Supplies the current access token and notifies on change.
Inputs/Outputs: currentCredential() → token or nothing; listeners receive the new value.
Threading: Implementations must be safe to query and notify from any thread.
Performance: Negligible; changes only on login / logout / refresh.
Integration: ConnectionManager registers one listener for its lifetime.
Observability: None.
Related: InMemoryCredentialSource.hpp, ConnectionManager.hpp.
Assumptions: Listeners do not call back into the source while being notified.
*/
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <utility>

class CredentialSource {
public:
    using Token    = std::string;
    using Listener = std::function<void(const std::optional<Token>&)>;

    // Unregisters its listener on destruction or reset(). Move-only.
    class Subscription {
    public:
        Subscription() = default;
        explicit Subscription(std::function<void()> unregister)
            : m_unregister(std::move(unregister)) {}
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept
            : m_unregister(std::exchange(other.m_unregister, nullptr)) {}
        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                m_unregister = std::exchange(other.m_unregister, nullptr);
            }
            return *this;
        }
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset() {
            if (auto fn = std::exchange(m_unregister, nullptr)) fn();
        }
        bool active() const { return static_cast<bool>(m_unregister); }

    private:
        std::function<void()> m_unregister;
    };

    virtual ~CredentialSource() = default;

    virtual std::optional<Token> currentCredential() const = 0;

    /// Register for change notifications. The listener is not invoked with
    /// the current value; query currentCredential() for that.
    [[nodiscard]] virtual Subscription subscribe(Listener listener) = 0;
};
