// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: SQLite-backed store of per-observation calculation records

**************************************************/

#ifndef OBSCALC_CALC_CALC_STORE_HPP
#define OBSCALC_CALC_CALC_STORE_HPP

#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "change_notifier.hpp"
#include "retry_policy.hpp"
#include "types.hpp"

namespace obscalc::database::core {
class Database;
class Statement;
}  // namespace obscalc::database::core

namespace obscalc::calc {

/**
 * @brief Error codes for store operations
 */
enum class StoreError {
    Unavailable,    ///< Database error; the operation may be retried
    ClaimLost,      ///< Record no longer calculating under this claim
    InvalidPayload  ///< Persisted result could not be decoded
};

[[nodiscard]] constexpr std::string_view storeErrorToString(
    StoreError error) noexcept {
    switch (error) {
        case StoreError::Unavailable: return "Store unavailable";
        case StoreError::ClaimLost: return "Claim lost";
        case StoreError::InvalidPayload: return "Invalid payload";
    }
    return "Unknown error";
}

template <typename T>
using StoreResult = std::expected<T, StoreError>;

/**
 * @brief Durable CalcRecord table (`t_obscalc`).
 *
 * Every mutation is a single-row read-modify-write inside an immediate
 * transaction, serialized by the store mutex. State transitions are
 * published on the attached ChangeNotifier after the transaction commits
 * and the lock is released.
 *
 * @note Thread-safe. Database exceptions never escape; they are logged and
 * reported as StoreError::Unavailable.
 */
class CalcStore {
public:
    /**
     * @brief Construct with existing database connection
     * @param db Shared pointer to database instance
     * @param notifier Receives state transitions, may be null
     * @throws std::runtime_error if database is invalid
     */
    explicit CalcStore(std::shared_ptr<database::core::Database> db,
                       std::shared_ptr<ChangeNotifier> notifier = nullptr);

    ~CalcStore() = default;

    CalcStore(const CalcStore&) = delete;
    CalcStore& operator=(const CalcStore&) = delete;

    // ==================== Reads ====================

    [[nodiscard]] auto get(const ObservationId& observationId)
        -> StoreResult<std::optional<CalcRecord>>;

    /// All records of a program, ordered by observation id.
    [[nodiscard]] auto getProgram(const ProgramId& programId)
        -> StoreResult<std::vector<CalcRecord>>;

    [[nodiscard]] auto countByState()
        -> StoreResult<std::map<CalcState, size_t>>;

    // ==================== Invalidation ====================

    /**
     * @brief Mark an observation dirty as of @p at.
     *
     * Creates a pending record if none exists. A pending record only moves
     * its lastInvalidation forward. A calculating record stays calculating
     * with a new version, so the in-flight result is dropped on completion.
     * Any other state returns to pending with retry bookkeeping cleared.
     */
    [[nodiscard]] auto upsertDirty(const ObservationId& observationId,
                                   const ProgramId& programId, Timestamp at)
        -> StoreResult<InvalidationOutcome>;

    /**
     * @brief upsertDirty for many observations in one transaction.
     * @param observations (observation, owning program) pairs
     * @return Number of records whose state or version changed
     */
    [[nodiscard]] auto upsertDirtyMany(
        const std::vector<std::pair<ObservationId, ProgramId>>& observations,
        Timestamp at) -> StoreResult<size_t>;

    // ==================== Claim protocol ====================

    /**
     * @brief Claim one specific observation.
     * @return Empty if the record is absent or not claimable at @p now
     */
    [[nodiscard]] auto claim(const ObservationId& observationId, Timestamp now)
        -> StoreResult<std::optional<ClaimToken>>;

    /// Claim the claimable record with the oldest lastInvalidation.
    [[nodiscard]] auto claimNext(Timestamp now)
        -> StoreResult<std::optional<ClaimToken>>;

    /// Claim up to @p max records, oldest lastInvalidation first.
    [[nodiscard]] auto claimBatch(size_t max, Timestamp now)
        -> StoreResult<std::vector<ClaimToken>>;

    /**
     * @brief Commit a computed result for a claim.
     *
     * If the record was invalidated after the claim it returns to pending,
     * @p result is discarded and lastUpdate is left untouched.
     *
     * @return StoreError::ClaimLost if the record is no longer held by
     * @p token
     */
    [[nodiscard]] auto complete(const ClaimToken& token,
                                const CalcResult& result, Timestamp computedAt)
        -> StoreResult<StoreOutcome>;

    /**
     * @brief Record a failed attempt for a claim, routed through @p policy.
     */
    [[nodiscard]] auto fail(const ClaimToken& token, FailureKind kind,
                            const std::string& message,
                            const RetryPolicy& policy, Timestamp computedAt)
        -> StoreResult<StoreOutcome>;

    /**
     * @brief Give a claim back without an outcome.
     *
     * Used when the outcome could not be recorded. The record returns to
     * retry when it carries a retryAt, otherwise to pending, so the next
     * claim recomputes it.
     *
     * @return StoreError::ClaimLost if the record is no longer held by
     * @p token
     */
    [[nodiscard]] auto release(const ClaimToken& token, Timestamp now)
        -> StoreResult<StoreOutcome>;

    // ==================== Maintenance ====================

    /// Delete the record of a deleted observation.
    [[nodiscard]] auto remove(const ObservationId& observationId,
                              Timestamp now) -> StoreResult<bool>;

    /**
     * @brief Release every claim, e.g. after a crash.
     *
     * Calculating records return to retry when they carry a retryAt,
     * otherwise to pending. Outstanding tokens become ClaimLost.
     */
    [[nodiscard]] auto resetCalculating(Timestamp now) -> StoreResult<size_t>;

    [[nodiscard]] auto getNotifier() const -> std::shared_ptr<ChangeNotifier>;

    /// Value stamped into PRAGMA user_version once the tables exist.
    static constexpr int kSchemaVersion = 1;

private:
    /// @throws std::runtime_error if the file carries a newer schema
    void initializeSchema();

    /// Reads the row for @p observationId. Caller holds the lock.
    auto selectRecord(const ObservationId& observationId)
        -> std::optional<CalcRecord>;

    static auto readRecord(const database::core::Statement& stmt)
        -> CalcRecord;

    /// Applies one invalidation. Caller holds the lock and a transaction.
    auto applyInvalidation(const ObservationId& observationId,
                           const ProgramId& programId, Timestamp at,
                           std::vector<CalcChangeEvent>& events)
        -> InvalidationOutcome;

    /// CAS claim of a row already read. Caller holds the lock.
    auto claimRecord(const CalcRecord& record, Timestamp now)
        -> std::optional<ClaimToken>;

    /// Loads the row held by @p token or nullopt if the claim is lost.
    auto selectClaimed(const ClaimToken& token) -> std::optional<CalcRecord>;

    void publish(const std::vector<CalcChangeEvent>& events);

    std::shared_ptr<database::core::Database> db_;
    std::shared_ptr<ChangeNotifier> notifier_;
    mutable std::shared_mutex mutex_;
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_CALC_STORE_HPP
