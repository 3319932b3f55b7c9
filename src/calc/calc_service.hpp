// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Public facade of the observation calculation cache

**************************************************/

#ifndef OBSCALC_CALC_CALC_SERVICE_HPP
#define OBSCALC_CALC_CALC_SERVICE_HPP

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "calc_store.hpp"
#include "calculator.hpp"
#include "invalidation_tracker.hpp"
#include "retry_policy.hpp"
#include "types.hpp"

namespace obscalc::calc {

/**
 * @brief Error codes returned across the service boundary
 */
enum class ServiceError {
    StoreUnavailable,
    NotFound,
    ClaimLost,
    InvalidPayload
};

[[nodiscard]] constexpr std::string_view serviceErrorToString(
    ServiceError error) noexcept {
    switch (error) {
        case ServiceError::StoreUnavailable: return "Store unavailable";
        case ServiceError::NotFound: return "Not found";
        case ServiceError::ClaimLost: return "Claim lost";
        case ServiceError::InvalidPayload: return "Invalid payload";
    }
    return "Unknown error";
}

template <typename T>
using ServiceResult = std::expected<T, ServiceError>;

/**
 * @brief Read view of one observation's cached calculation.
 */
struct CalcResultView {
    ObservationId observationId;
    ProgramId programId;
    CalcState state{CalcState::Pending};
    std::optional<CalcResult> result;
    std::optional<std::string> errorMessage;
    std::optional<Timestamp> lastUpdate;
    Timestamp lastInvalidation{};

    /// Ready and not invalidated since the result was computed.
    [[nodiscard]] bool isCurrent() const noexcept {
        return state == CalcState::Ready && lastUpdate &&
               *lastUpdate >= lastInvalidation;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Invalidation intake, claim/complete protocol and reads.
 *
 * Every read and claim first drains queued owner sweeps, so a caller never
 * sees a ready record whose owner change was accepted earlier. Nothing
 * throws across this boundary.
 *
 * @note Thread-safe.
 */
class CalcService {
public:
    using TimeSource = std::function<Timestamp()>;

    /**
     * @param clock Supplies claim and completion times, injectable for tests
     * @throws std::invalid_argument if store or tracker is null
     */
    CalcService(std::shared_ptr<CalcStore> store,
                std::shared_ptr<InvalidationTracker> tracker,
                RetryPolicy retryPolicy = RetryPolicy(),
                TimeSource clock = currentTime);

    CalcService(const CalcService&) = delete;
    CalcService& operator=(const CalcService&) = delete;

    // ==================== Invalidation intake ====================

    auto notifyChanged(const ObservationId& observationId,
                       Timestamp changeTime)
        -> ServiceResult<InvalidationOutcome>;

    void notifyChangedForOwner(const OwnerRef& owner, Timestamp changeTime);

    // ==================== Claim / complete ====================

    /// Claim the oldest claimable observation.
    auto claim() -> ServiceResult<std::optional<PendingCalc>>;

    auto claimObservation(const ObservationId& observationId)
        -> ServiceResult<std::optional<PendingCalc>>;

    auto claimBatch(size_t max) -> ServiceResult<std::vector<PendingCalc>>;

    /**
     * @brief Commit a result computed for the claim @p snapshotVersion.
     * @return ServiceError::ClaimLost if the claim is no longer held
     */
    auto complete(const ObservationId& observationId, Version snapshotVersion,
                  const CalcResult& result) -> ServiceResult<StoreOutcome>;

    auto fail(const ObservationId& observationId, Version snapshotVersion,
              bool transient, const std::string& message)
        -> ServiceResult<StoreOutcome>;

    /// Hand a claim back unfinished; the record becomes claimable again.
    auto release(const ObservationId& observationId, Version snapshotVersion)
        -> ServiceResult<StoreOutcome>;

    // ==================== Reads ====================

    auto getResult(const ObservationId& observationId)
        -> ServiceResult<CalcResultView>;

    auto getProgramResults(const ProgramId& programId)
        -> ServiceResult<std::vector<CalcResultView>>;

    // ==================== Maintenance ====================

    /// Release every claim. Run at startup, before workers start.
    auto resetCalculating() -> ServiceResult<size_t>;

    auto removeObservation(const ObservationId& observationId)
        -> ServiceResult<bool>;

    /// Record counts per state plus notifier and sweep counters.
    auto statistics() -> ServiceResult<nlohmann::json>;

    [[nodiscard]] auto getNotifier() const -> std::shared_ptr<ChangeNotifier>;

    [[nodiscard]] auto getTracker() const
        -> std::shared_ptr<InvalidationTracker>;

    [[nodiscard]] const RetryPolicy& getRetryPolicy() const;

    [[nodiscard]] Timestamp now() const;

private:
    /// Applies queued owner sweeps; failure is logged and returned.
    auto drainSweeps() -> ServiceResult<void>;

    static auto toPending(const ClaimToken& token) -> PendingCalc;

    static auto toView(const CalcRecord& record) -> CalcResultView;

    std::shared_ptr<CalcStore> store_;
    std::shared_ptr<InvalidationTracker> tracker_;
    RetryPolicy retryPolicy_;
    TimeSource clock_;
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_CALC_SERVICE_HPP
