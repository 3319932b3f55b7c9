// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Typed, owner-scoped event bus for calculation state changes

**************************************************/

#ifndef OBSCALC_CALC_CHANGE_NOTIFIER_HPP
#define OBSCALC_CALC_CHANGE_NOTIFIER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace obscalc::calc {

/**
 * @brief A visible state transition of one CalcRecord.
 *
 * previousState is empty when the record was created, newState is empty when
 * it was deleted. Subscribers should re-read the record rather than trust
 * the payload.
 */
struct CalcChangeEvent {
    ObservationId observationId;
    ProgramId programId;
    std::optional<CalcState> previousState;
    std::optional<CalcState> newState;
    Timestamp timestamp{};
    uint64_t sequenceNumber{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

using CalcChangeCallback = std::function<void(const CalcChangeEvent&)>;

using SubscriptionId = uint64_t;

/**
 * @brief Publishes CalcChangeEvents to in-process subscribers.
 *
 * Delivery is synchronous on the publishing thread and best-effort: a
 * subscriber that throws is logged and skipped. Callbacks run without the
 * notifier's lock held, so they may subscribe, unsubscribe or publish.
 */
class ChangeNotifier {
public:
    explicit ChangeNotifier(size_t maxHistorySize = 1000);

    ChangeNotifier(const ChangeNotifier&) = delete;
    ChangeNotifier& operator=(const ChangeNotifier&) = delete;

    // ==================== Event Publishing ====================

    /**
     * @brief Publish an event
     * @param event Event to publish, its sequence number is assigned here
     */
    void publish(const CalcChangeEvent& event);

    // ==================== Event Subscription ====================

    /**
     * @brief Subscribe to all events
     * @return Subscription ID
     */
    auto subscribeAll(CalcChangeCallback callback) -> SubscriptionId;

    /**
     * @brief Subscribe to events of the observations of one program
     */
    auto subscribeOwner(const ProgramId& programId,
                        CalcChangeCallback callback) -> SubscriptionId;

    /**
     * @brief Subscribe to transitions into @p newState
     */
    auto subscribe(CalcState newState, CalcChangeCallback callback)
        -> SubscriptionId;

    /**
     * @brief Remove a subscription
     * @return false if the id was unknown
     */
    bool unsubscribe(SubscriptionId subscriptionId);

    void clearSubscriptions();

    // ==================== History & Statistics ====================

    [[nodiscard]] auto getRecentEvents(size_t count = 100) const
        -> std::vector<CalcChangeEvent>;

    void clearHistory();

    void setMaxHistorySize(size_t size);

    [[nodiscard]] auto getSubscriptionCount() const -> size_t;

    [[nodiscard]] auto getPublishedCount() const -> uint64_t;

    [[nodiscard]] auto getStatistics() const -> nlohmann::json;

private:
    struct Subscription {
        SubscriptionId id;
        CalcChangeCallback callback;
        std::optional<ProgramId> programId;
        std::optional<CalcState> newState;
    };

    void dispatchEvent(const CalcChangeEvent& event);

    void recordEvent(const CalcChangeEvent& event);

    mutable std::shared_mutex mutex_;

    std::vector<Subscription> subscriptions_;
    SubscriptionId nextSubscriptionId_{1};

    std::vector<CalcChangeEvent> eventHistory_;
    size_t maxHistorySize_;

    std::atomic<uint64_t> sequenceCounter_{0};
    std::atomic<uint64_t> publishedCount_{0};
    std::atomic<uint64_t> callbackFailures_{0};
    std::unordered_map<std::string, uint64_t> transitionCounts_;
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_CHANGE_NOTIFIER_HPP
