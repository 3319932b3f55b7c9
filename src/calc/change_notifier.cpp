// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "change_notifier.hpp"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

namespace obscalc::calc {

namespace {

std::string stateName(const std::optional<CalcState>& state) {
    return state ? std::string(calcStateToString(*state)) : "none";
}

}  // namespace

auto CalcChangeEvent::toJson() const -> nlohmann::json {
    nlohmann::json j;
    j["observationId"] = observationId;
    j["programId"] = programId;
    j["previousState"] = previousState
                             ? nlohmann::json(std::string(
                                   calcStateToString(*previousState)))
                             : nlohmann::json(nullptr);
    j["newState"] = newState ? nlohmann::json(std::string(
                                   calcStateToString(*newState)))
                             : nlohmann::json(nullptr);
    j["timestamp"] = toMicros(timestamp);
    j["sequenceNumber"] = sequenceNumber;
    return j;
}

ChangeNotifier::ChangeNotifier(size_t maxHistorySize)
    : maxHistorySize_(maxHistorySize) {}

void ChangeNotifier::publish(const CalcChangeEvent& event) {
    CalcChangeEvent eventCopy = event;
    eventCopy.sequenceNumber = sequenceCounter_++;

    publishedCount_++;

    {
        std::unique_lock lock(mutex_);
        transitionCounts_[stateName(event.previousState) + "->" +
                          stateName(event.newState)]++;
    }

    recordEvent(eventCopy);
    dispatchEvent(eventCopy);

    spdlog::debug("Published calc change: {} {} -> {} (seq {})",
                  eventCopy.observationId, stateName(eventCopy.previousState),
                  stateName(eventCopy.newState), eventCopy.sequenceNumber);
}

auto ChangeNotifier::subscribeAll(CalcChangeCallback callback)
    -> SubscriptionId {
    std::unique_lock lock(mutex_);

    SubscriptionId id = nextSubscriptionId_++;
    subscriptions_.push_back(
        Subscription{id, std::move(callback), std::nullopt, std::nullopt});

    return id;
}

auto ChangeNotifier::subscribeOwner(const ProgramId& programId,
                                    CalcChangeCallback callback)
    -> SubscriptionId {
    std::unique_lock lock(mutex_);

    SubscriptionId id = nextSubscriptionId_++;
    subscriptions_.push_back(
        Subscription{id, std::move(callback), programId, std::nullopt});

    return id;
}

auto ChangeNotifier::subscribe(CalcState newState, CalcChangeCallback callback)
    -> SubscriptionId {
    std::unique_lock lock(mutex_);

    SubscriptionId id = nextSubscriptionId_++;
    subscriptions_.push_back(
        Subscription{id, std::move(callback), std::nullopt, newState});

    return id;
}

bool ChangeNotifier::unsubscribe(SubscriptionId subscriptionId) {
    std::unique_lock lock(mutex_);

    auto it = std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                             [subscriptionId](const Subscription& sub) {
                                 return sub.id == subscriptionId;
                             });
    bool found = it != subscriptions_.end();
    subscriptions_.erase(it, subscriptions_.end());
    return found;
}

void ChangeNotifier::clearSubscriptions() {
    std::unique_lock lock(mutex_);
    subscriptions_.clear();
}

auto ChangeNotifier::getRecentEvents(size_t count) const
    -> std::vector<CalcChangeEvent> {
    std::shared_lock lock(mutex_);

    if (eventHistory_.empty()) {
        return {};
    }

    size_t start = (eventHistory_.size() > count)
                       ? eventHistory_.size() - count
                       : 0;
    return std::vector<CalcChangeEvent>(eventHistory_.begin() + start,
                                        eventHistory_.end());
}

void ChangeNotifier::clearHistory() {
    std::unique_lock lock(mutex_);
    eventHistory_.clear();
}

void ChangeNotifier::setMaxHistorySize(size_t size) {
    std::unique_lock lock(mutex_);
    maxHistorySize_ = size;
    if (eventHistory_.size() > maxHistorySize_) {
        eventHistory_.erase(eventHistory_.begin(),
                            eventHistory_.begin() +
                                (eventHistory_.size() - maxHistorySize_));
    }
}

auto ChangeNotifier::getSubscriptionCount() const -> size_t {
    std::shared_lock lock(mutex_);
    return subscriptions_.size();
}

auto ChangeNotifier::getPublishedCount() const -> uint64_t {
    return publishedCount_.load();
}

auto ChangeNotifier::getStatistics() const -> nlohmann::json {
    std::shared_lock lock(mutex_);

    nlohmann::json stats;
    stats["publishedCount"] = publishedCount_.load();
    stats["subscriptionCount"] = subscriptions_.size();
    stats["historySize"] = eventHistory_.size();
    stats["maxHistorySize"] = maxHistorySize_;
    stats["callbackFailures"] = callbackFailures_.load();

    nlohmann::json counts = nlohmann::json::object();
    for (const auto& [transition, count] : transitionCounts_) {
        counts[transition] = count;
    }
    stats["transitionCounts"] = counts;

    return stats;
}

void ChangeNotifier::dispatchEvent(const CalcChangeEvent& event) {
    std::vector<CalcChangeCallback> targets;
    {
        std::shared_lock lock(mutex_);
        for (const auto& sub : subscriptions_) {
            if (sub.programId.has_value() && *sub.programId != event.programId) {
                continue;
            }
            if (sub.newState.has_value() && sub.newState != event.newState) {
                continue;
            }
            targets.push_back(sub.callback);
        }
    }

    for (const auto& callback : targets) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            callbackFailures_++;
            spdlog::warn("Calc change callback exception for {}: {}",
                         event.observationId, e.what());
        } catch (...) {
            callbackFailures_++;
            spdlog::warn("Calc change callback for {} threw a non-standard "
                         "exception",
                         event.observationId);
        }
    }
}

void ChangeNotifier::recordEvent(const CalcChangeEvent& event) {
    std::unique_lock lock(mutex_);

    if (maxHistorySize_ == 0) {
        return;
    }

    eventHistory_.push_back(event);

    // Trim history if needed
    if (eventHistory_.size() > maxHistorySize_) {
        eventHistory_.erase(eventHistory_.begin(),
                            eventHistory_.begin() +
                                (eventHistory_.size() - maxHistorySize_));
    }
}

}  // namespace obscalc::calc
