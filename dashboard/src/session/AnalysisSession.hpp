#pragma once

#include "geo/AnalysisResult.hpp"
#include "geo/GeoTypes.hpp"
#include "networking/AnalyzerClient.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

namespace GeoHex {
namespace Dashboard {

/**
 * @brief Lifecycle of the analysis request
 */
enum class SessionState {
    Idle,
    Requesting,
    Succeeded,
    Failed
};

const char* SessionStateToString(SessionState state);

/**
 * @brief Consistent copy of the session slot
 *
 * result holds the latest successful analysis and survives a later
 * failure; only state tells whether the last request succeeded.
 */
struct SessionSnapshot {
    SessionState state = SessionState::Idle;
    uint64_t ticket = 0;
    uint64_t version = 0;   ///< Increases with every state change
    std::optional<Geo::HexagonSpec> pendingSpec;
    std::optional<Geo::AnalysisResult> result;
    std::optional<Geo::HexagonSpec> resultSpec;
    std::optional<Net::AnalyzerFailure> failure;
};

/**
 * @brief Single-slot holder for the dashboard's analysis request
 *
 * At most one request is current. Starting a new one supersedes the
 * outstanding request: its completion is discarded when it arrives
 * (last request wins, nothing is queued).
 */
class AnalysisSession {
public:
    using Ticket = uint64_t;
    using Outcome = std::expected<Geo::AnalysisResult, Net::AnalyzerFailure>;
    using StateListener = std::function<void(const SessionSnapshot&)>;

    explicit AnalysisSession(Net::AnalyzerClient& client);

    AnalysisSession(const AnalysisSession&) = delete;
    AnalysisSession& operator=(const AnalysisSession&) = delete;

    /**
     * @brief Enter Requesting for @p spec
     * @return Ticket identifying this request
     */
    Ticket Begin(const Geo::HexagonSpec& spec);

    /**
     * @brief Deliver the outcome of a request
     * @return false when the ticket was superseded and the outcome dropped
     */
    bool Complete(Ticket ticket, Outcome outcome);

    /**
     * @brief Health check followed by analysis, on the calling thread
     */
    SessionSnapshot Run(const Geo::HexagonSpec& spec);

    /**
     * @brief Run() on a worker thread
     *
     * The session is already Requesting when this returns.
     */
    std::future<SessionSnapshot> RunAsync(const Geo::HexagonSpec& spec);

    /**
     * @brief Return a terminal state to Idle
     */
    void Acknowledge();

    /**
     * @brief False while a request is outstanding
     */
    bool CanStart() const;

    SessionState GetState() const;
    SessionSnapshot GetSnapshot() const;

    /**
     * @brief Called after state changes, outside the session lock
     *
     * Deliveries are serialised in version order. A snapshot older than one
     * already delivered is skipped, so a listener's last view matches the
     * session. Listeners may call back into the session on the same thread
     * but must not wait on another thread that changes it.
     */
    void AddListener(StateListener listener);

private:
    SessionSnapshot Execute(Ticket ticket, const Geo::HexagonSpec& spec);
    void Notify(const SessionSnapshot& snapshot);

    Net::AnalyzerClient& m_client;

    mutable std::mutex m_mutex;
    SessionSnapshot m_slot;
    Ticket m_nextTicket = 1;

    std::mutex m_listenerMutex;
    std::vector<StateListener> m_listeners;

    std::recursive_mutex m_deliveryMutex;
    uint64_t m_deliveredVersion = 0;
};

} // namespace Dashboard
} // namespace GeoHex
