#include "AnalysisSession.hpp"
#include "core/Logger.hpp"

namespace GeoHex {
namespace Dashboard {

const char* SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Idle:       return "idle";
        case SessionState::Requesting: return "requesting";
        case SessionState::Succeeded:  return "succeeded";
        case SessionState::Failed:     return "failed";
    }
    return "unknown";
}

AnalysisSession::AnalysisSession(Net::AnalyzerClient& client)
    : m_client(client) {
}

AnalysisSession::Ticket AnalysisSession::Begin(const Geo::HexagonSpec& spec) {
    SessionSnapshot snapshot;
    {
        std::lock_guard lock(m_mutex);
        if (m_slot.state == SessionState::Requesting) {
            APP_LOG_INFO("[Session] Request #{} superseded", m_slot.ticket);
        }
        m_slot.state = SessionState::Requesting;
        m_slot.ticket = m_nextTicket++;
        m_slot.pendingSpec = spec;
        m_slot.failure.reset();
        ++m_slot.version;
        snapshot = m_slot;
    }
    APP_LOG_DEBUG("[Session] Request #{} started", snapshot.ticket);
    Notify(snapshot);
    return snapshot.ticket;
}

bool AnalysisSession::Complete(Ticket ticket, Outcome outcome) {
    SessionSnapshot snapshot;
    {
        std::lock_guard lock(m_mutex);
        if (ticket != m_slot.ticket || m_slot.state != SessionState::Requesting) {
            APP_LOG_DEBUG("[Session] Dropping stale outcome of request #{}", ticket);
            return false;
        }

        if (outcome) {
            m_slot.state = SessionState::Succeeded;
            m_slot.result = std::move(*outcome);
            m_slot.resultSpec = m_slot.pendingSpec;
            m_slot.failure.reset();
        } else {
            m_slot.state = SessionState::Failed;
            m_slot.failure = std::move(outcome.error());
        }
        m_slot.pendingSpec.reset();
        ++m_slot.version;
        snapshot = m_slot;
    }

    if (snapshot.state == SessionState::Succeeded) {
        APP_LOG_INFO("[Session] Request #{} succeeded", ticket);
    } else {
        APP_LOG_WARN("[Session] Request #{} failed: {}", ticket, snapshot.failure->message);
    }
    Notify(snapshot);
    return true;
}

SessionSnapshot AnalysisSession::Run(const Geo::HexagonSpec& spec) {
    return Execute(Begin(spec), spec);
}

std::future<SessionSnapshot> AnalysisSession::RunAsync(const Geo::HexagonSpec& spec) {
    const Ticket ticket = Begin(spec);
    return std::async(std::launch::async, [this, ticket, spec]() {
        return Execute(ticket, spec);
    });
}

SessionSnapshot AnalysisSession::Execute(Ticket ticket, const Geo::HexagonSpec& spec) {
    if (!m_client.CheckHealth()) {
        Net::AnalyzerFailure failure;
        failure.kind = Net::AnalyzerErrorKind::Unreachable;
        failure.message = Net::ANALYZER_UNAVAILABLE_MESSAGE;
        Complete(ticket, std::unexpected(std::move(failure)));
    } else {
        Complete(ticket, m_client.Analyze(spec));
    }
    return GetSnapshot();
}

void AnalysisSession::Acknowledge() {
    SessionSnapshot snapshot;
    {
        std::lock_guard lock(m_mutex);
        if (m_slot.state != SessionState::Succeeded && m_slot.state != SessionState::Failed) {
            return;
        }
        m_slot.state = SessionState::Idle;
        ++m_slot.version;
        snapshot = m_slot;
    }
    Notify(snapshot);
}

bool AnalysisSession::CanStart() const {
    std::lock_guard lock(m_mutex);
    return m_slot.state != SessionState::Requesting;
}

SessionState AnalysisSession::GetState() const {
    std::lock_guard lock(m_mutex);
    return m_slot.state;
}

SessionSnapshot AnalysisSession::GetSnapshot() const {
    std::lock_guard lock(m_mutex);
    return m_slot;
}

void AnalysisSession::AddListener(StateListener listener) {
    std::lock_guard lock(m_listenerMutex);
    m_listeners.push_back(std::move(listener));
}

void AnalysisSession::Notify(const SessionSnapshot& snapshot) {
    std::vector<StateListener> listeners;
    {
        std::lock_guard lock(m_listenerMutex);
        listeners = m_listeners;
    }

    std::lock_guard delivery(m_deliveryMutex);
    if (snapshot.version <= m_deliveredVersion) {
        APP_LOG_DEBUG("[Session] Skipping stale notification v{} (delivered v{})",
                      snapshot.version, m_deliveredVersion);
        return;
    }
    m_deliveredVersion = snapshot.version;

    for (const auto& listener : listeners) {
        // A listener that changed the session has delivered newer state already
        if (m_deliveredVersion != snapshot.version) {
            break;
        }
        if (listener) {
            listener(snapshot);
        }
    }
}

} // namespace Dashboard
} // namespace GeoHex
