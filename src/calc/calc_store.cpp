// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "calc_store.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "database/core/database.hpp"
#include "database/core/statement.hpp"
#include "database/core/transaction.hpp"

namespace obscalc::calc {

using database::core::Statement;
using database::core::TransactionMode;

namespace {

/// Thrown while reading a row whose c_result is not a valid payload.
class PayloadDecodeError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

constexpr std::string_view SELECT_COLUMNS = R"(
    SELECT c_observation_id, c_program_id, c_state, c_last_invalidation,
           c_last_update, c_retry_at, c_failure_count, c_version,
           c_claimed_version, c_result, c_error_message
    FROM t_obscalc
)";

std::string stateParam(CalcState state) {
    return std::string(calcStateToString(state));
}

std::optional<Timestamp> optionalTimestamp(const std::optional<int64_t>& v) {
    if (!v) {
        return std::nullopt;
    }
    return fromMicros(*v);
}

/// lastInvalidation after applying a change at @p at: never moves backwards
/// and always lands strictly after the last committed computation.
Timestamp nextInvalidation(const CalcRecord& record, Timestamp at) {
    Timestamp next = std::max(record.lastInvalidation, at);
    if (record.lastUpdate && next <= *record.lastUpdate) {
        next = *record.lastUpdate + std::chrono::microseconds{1};
    }
    return next;
}

CalcChangeEvent makeEvent(const CalcRecord& record,
                          std::optional<CalcState> previous,
                          std::optional<CalcState> next, Timestamp at) {
    CalcChangeEvent event;
    event.observationId = record.observationId;
    event.programId = record.programId;
    event.previousState = previous;
    event.newState = next;
    event.timestamp = at;
    return event;
}

}  // namespace

// ============================================================================
// CalcStore Implementation
// ============================================================================

CalcStore::CalcStore(std::shared_ptr<database::core::Database> db,
                     std::shared_ptr<ChangeNotifier> notifier)
    : db_(std::move(db)), notifier_(std::move(notifier)) {
    if (!db_ || !db_->isValid()) {
        throw std::runtime_error("Invalid database connection");
    }
    initializeSchema();
    SPDLOG_INFO("CalcStore initialized");
}

void CalcStore::initializeSchema() {
    std::unique_lock lock(mutex_);

    if (int found = db_->userVersion(); found > kSchemaVersion) {
        throw std::runtime_error(
            "Calculation cache schema version " + std::to_string(found) +
            " is newer than supported version " +
            std::to_string(kSchemaVersion));
    }

    db_->execute(R"(
        CREATE TABLE IF NOT EXISTS t_obscalc (
            c_observation_id    TEXT PRIMARY KEY,
            c_program_id        TEXT NOT NULL,
            c_state             TEXT NOT NULL DEFAULT 'pending'
                CHECK (c_state IN ('pending', 'retry', 'calculating',
                                   'ready', 'failed')),
            c_last_invalidation INTEGER NOT NULL,
            c_last_update       INTEGER,
            c_retry_at          INTEGER,
            c_failure_count     INTEGER NOT NULL DEFAULT 0
                CHECK (c_failure_count >= 0),
            c_version           INTEGER NOT NULL DEFAULT 0,
            c_claimed_version   INTEGER,
            c_result            TEXT,
            c_error_message     TEXT,

            CHECK (c_state IN ('retry', 'calculating') OR
                   (c_failure_count = 0 AND c_retry_at IS NULL)),
            CHECK (c_state <> 'retry' OR c_retry_at IS NOT NULL),
            CHECK ((c_state = 'failed') = (c_error_message IS NOT NULL)),
            CHECK ((c_state = 'calculating') = (c_claimed_version IS NOT NULL))
        )
    )");

    db_->execute(
        "CREATE INDEX IF NOT EXISTS i_obscalc_claimable "
        "ON t_obscalc(c_state, c_last_invalidation)");
    db_->execute(
        "CREATE INDEX IF NOT EXISTS i_obscalc_program "
        "ON t_obscalc(c_program_id)");
    db_->setUserVersion(kSchemaVersion);
}

auto CalcStore::readRecord(const Statement& stmt) -> CalcRecord {
    CalcRecord record;
    record.observationId = stmt.getText(0);
    record.programId = stmt.getText(1);

    auto state = calcStateFromString(stmt.getText(2));
    if (!state) {
        throw std::runtime_error("Unknown calc state: " + stmt.getText(2));
    }
    record.state = *state;
    record.lastInvalidation = fromMicros(stmt.getInt64(3));
    record.lastUpdate = optionalTimestamp(stmt.getOptionalInt64(4));
    record.retryAt = optionalTimestamp(stmt.getOptionalInt64(5));
    record.failureCount = stmt.getInt(6);
    record.version = stmt.getInt64(7);
    record.claimedVersion = stmt.getOptionalInt64(8);

    if (auto payload = stmt.getOptionalText(9)) {
        try {
            record.result = CalcResult::fromJson(nlohmann::json::parse(*payload));
        } catch (const std::exception& e) {
            throw PayloadDecodeError("Invalid result payload for " +
                                     record.observationId + ": " + e.what());
        }
    }
    record.errorMessage = stmt.getOptionalText(10);
    return record;
}

auto CalcStore::selectRecord(const ObservationId& observationId)
    -> std::optional<CalcRecord> {
    auto stmt = db_->prepare(std::string(SELECT_COLUMNS) +
                             " WHERE c_observation_id = ?");
    stmt->bind(1, observationId);
    if (!stmt->step()) {
        return std::nullopt;
    }
    return readRecord(*stmt);
}

void CalcStore::publish(const std::vector<CalcChangeEvent>& events) {
    if (!notifier_) {
        return;
    }
    for (const auto& event : events) {
        notifier_->publish(event);
    }
}

auto CalcStore::getNotifier() const -> std::shared_ptr<ChangeNotifier> {
    return notifier_;
}

// ==================== Reads ====================

auto CalcStore::get(const ObservationId& observationId)
    -> StoreResult<std::optional<CalcRecord>> {
    try {
        std::shared_lock lock(mutex_);
        return selectRecord(observationId);
    } catch (const PayloadDecodeError& e) {
        SPDLOG_ERROR("Get failed: {}", e.what());
        return std::unexpected(StoreError::InvalidPayload);
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Get failed for {}: {}", observationId, e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

auto CalcStore::getProgram(const ProgramId& programId)
    -> StoreResult<std::vector<CalcRecord>> {
    try {
        std::shared_lock lock(mutex_);

        auto stmt = db_->prepare(std::string(SELECT_COLUMNS) +
                                 " WHERE c_program_id = ?"
                                 " ORDER BY c_observation_id");
        stmt->bind(1, programId);

        std::vector<CalcRecord> records;
        while (stmt->step()) {
            records.push_back(readRecord(*stmt));
        }
        return records;
    } catch (const PayloadDecodeError& e) {
        SPDLOG_ERROR("Program read failed: {}", e.what());
        return std::unexpected(StoreError::InvalidPayload);
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Program read failed for {}: {}", programId, e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

auto CalcStore::countByState() -> StoreResult<std::map<CalcState, size_t>> {
    try {
        std::shared_lock lock(mutex_);

        auto stmt = db_->prepare(
            "SELECT c_state, COUNT(*) FROM t_obscalc GROUP BY c_state");

        std::map<CalcState, size_t> counts;
        while (stmt->step()) {
            if (auto state = calcStateFromString(stmt->getText(0))) {
                counts[*state] = static_cast<size_t>(stmt->getInt64(1));
            }
        }
        return counts;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Count by state failed: {}", e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

// ==================== Invalidation ====================

auto CalcStore::applyInvalidation(const ObservationId& observationId,
                                  const ProgramId& programId, Timestamp at,
                                  std::vector<CalcChangeEvent>& events)
    -> InvalidationOutcome {
    auto current = selectRecord(observationId);
    if (!current) {
        auto stmt = db_->prepare(R"(
            INSERT INTO t_obscalc (c_observation_id, c_program_id, c_state,
                                   c_last_invalidation, c_version)
            VALUES (?, ?, 'pending', ?, 1)
        )");
        stmt->bind(1, observationId).bind(2, programId).bind(3, toMicros(at));
        stmt->execute();

        CalcRecord created;
        created.observationId = observationId;
        created.programId = programId;
        events.push_back(
            makeEvent(created, std::nullopt, CalcState::Pending, at));
        return InvalidationOutcome::Created;
    }

    const CalcRecord& record = *current;
    Timestamp next = nextInvalidation(record, at);

    switch (record.state) {
        case CalcState::Pending: {
            if (at <= record.lastInvalidation) {
                return InvalidationOutcome::Unchanged;
            }
            auto stmt = db_->prepare(R"(
                UPDATE t_obscalc
                SET c_program_id = ?, c_last_invalidation = ?,
                    c_version = c_version + 1
                WHERE c_observation_id = ?
            )");
            stmt->bind(1, programId)
                .bind(2, toMicros(next))
                .bind(3, observationId);
            stmt->execute();
            return InvalidationOutcome::Advanced;
        }
        case CalcState::Calculating: {
            // Stays claimed; the version bump makes the in-flight
            // complete/fail land in pending.
            auto stmt = db_->prepare(R"(
                UPDATE t_obscalc
                SET c_program_id = ?, c_last_invalidation = ?,
                    c_version = c_version + 1,
                    c_failure_count = 0, c_retry_at = NULL
                WHERE c_observation_id = ?
            )");
            stmt->bind(1, programId)
                .bind(2, toMicros(next))
                .bind(3, observationId);
            stmt->execute();
            return InvalidationOutcome::Superseded;
        }
        case CalcState::Retry:
        case CalcState::Ready:
        case CalcState::Failed: {
            auto stmt = db_->prepare(R"(
                UPDATE t_obscalc
                SET c_program_id = ?, c_state = 'pending',
                    c_last_invalidation = ?, c_version = c_version + 1,
                    c_failure_count = 0, c_retry_at = NULL,
                    c_error_message = NULL
                WHERE c_observation_id = ?
            )");
            stmt->bind(1, programId)
                .bind(2, toMicros(next))
                .bind(3, observationId);
            stmt->execute();
            events.push_back(
                makeEvent(record, record.state, CalcState::Pending, at));
            return InvalidationOutcome::Reset;
        }
    }
    return InvalidationOutcome::Unchanged;
}

auto CalcStore::upsertDirty(const ObservationId& observationId,
                            const ProgramId& programId, Timestamp at)
    -> StoreResult<InvalidationOutcome> {
    try {
        std::vector<CalcChangeEvent> events;
        InvalidationOutcome outcome;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);
            outcome = applyInvalidation(observationId, programId, at, events);
            tx->commit();
        }

        SPDLOG_DEBUG("Invalidated {} at {}: {}", observationId, toMicros(at),
                     invalidationOutcomeToString(outcome));
        publish(events);
        return outcome;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Invalidation failed for {}: {}", observationId, e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

auto CalcStore::upsertDirtyMany(
    const std::vector<std::pair<ObservationId, ProgramId>>& observations,
    Timestamp at) -> StoreResult<size_t> {
    if (observations.empty()) {
        return size_t{0};
    }

    try {
        std::vector<CalcChangeEvent> events;
        size_t changed = 0;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);
            for (const auto& [observationId, programId] : observations) {
                auto outcome =
                    applyInvalidation(observationId, programId, at, events);
                if (outcome != InvalidationOutcome::Unchanged) {
                    ++changed;
                }
            }
            tx->commit();
        }

        SPDLOG_DEBUG("Invalidated {} of {} record(s) at {}", changed,
                     observations.size(), toMicros(at));
        publish(events);
        return changed;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Batch invalidation failed: {}", e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

// ==================== Claim protocol ====================

auto CalcStore::claimRecord(const CalcRecord& record, Timestamp now)
    -> std::optional<ClaimToken> {
    if (!record.isClaimable(now)) {
        return std::nullopt;
    }

    // Compare-and-set on (state, version)
    auto stmt = db_->prepare(R"(
        UPDATE t_obscalc
        SET c_state = 'calculating',
            c_version = c_version + 1,
            c_claimed_version = c_version + 1
        WHERE c_observation_id = ? AND c_state = ? AND c_version = ?
    )");
    stmt->bind(1, record.observationId)
        .bind(2, stateParam(record.state))
        .bind(3, record.version);
    stmt->execute();

    if (db_->changes() != 1) {
        return std::nullopt;
    }

    ClaimToken token;
    token.observationId = record.observationId;
    token.programId = record.programId;
    token.snapshotVersion = record.version + 1;
    token.lastInvalidation = record.lastInvalidation;
    token.failureCount = record.failureCount;
    token.retryAt = record.retryAt;
    return token;
}

auto CalcStore::claim(const ObservationId& observationId, Timestamp now)
    -> StoreResult<std::optional<ClaimToken>> {
    try {
        std::vector<CalcChangeEvent> events;
        std::optional<ClaimToken> token;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);

            if (auto record = selectRecord(observationId)) {
                token = claimRecord(*record, now);
                if (token) {
                    events.push_back(makeEvent(*record, record->state,
                                               CalcState::Calculating, now));
                }
            }

            tx->commit();
        }

        if (token) {
            SPDLOG_DEBUG("Claimed {} (version {})", observationId,
                         token->snapshotVersion);
        }
        publish(events);
        return token;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Claim failed for {}: {}", observationId, e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

auto CalcStore::claimNext(Timestamp now)
    -> StoreResult<std::optional<ClaimToken>> {
    auto batch = claimBatch(1, now);
    if (!batch) {
        return std::unexpected(batch.error());
    }
    if (batch->empty()) {
        return std::optional<ClaimToken>{};
    }
    return std::optional<ClaimToken>{std::move(batch->front())};
}

auto CalcStore::claimBatch(size_t max, Timestamp now)
    -> StoreResult<std::vector<ClaimToken>> {
    if (max == 0) {
        return std::vector<ClaimToken>{};
    }

    try {
        std::vector<CalcChangeEvent> events;
        std::vector<ClaimToken> tokens;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);

            auto stmt = db_->prepare(R"(
                SELECT c_observation_id FROM t_obscalc
                WHERE c_state = 'pending'
                   OR (c_state = 'retry' AND c_retry_at <= ?)
                ORDER BY c_last_invalidation, c_observation_id
                LIMIT ?
            )");
            stmt->bind(1, toMicros(now)).bind(2, static_cast<int64_t>(max));

            std::vector<ObservationId> candidates;
            while (stmt->step()) {
                candidates.push_back(stmt->getText(0));
            }

            for (const auto& observationId : candidates) {
                auto record = selectRecord(observationId);
                if (!record) {
                    continue;
                }
                if (auto token = claimRecord(*record, now)) {
                    events.push_back(makeEvent(*record, record->state,
                                               CalcState::Calculating, now));
                    tokens.push_back(std::move(*token));
                }
            }

            tx->commit();
        }

        if (!tokens.empty()) {
            SPDLOG_DEBUG("Claimed {} record(s)", tokens.size());
        }
        publish(events);
        return tokens;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Batch claim failed: {}", e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

auto CalcStore::selectClaimed(const ClaimToken& token)
    -> std::optional<CalcRecord> {
    auto record = selectRecord(token.observationId);
    if (!record || record->state != CalcState::Calculating ||
        record->claimedVersion != token.snapshotVersion) {
        return std::nullopt;
    }
    return record;
}

auto CalcStore::complete(const ClaimToken& token, const CalcResult& result,
                         Timestamp computedAt) -> StoreResult<StoreOutcome> {
    try {
        std::vector<CalcChangeEvent> events;
        StoreOutcome outcome;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);

            auto record = selectClaimed(token);
            if (!record) {
                SPDLOG_WARN("Complete rejected for {}: claim lost",
                            token.observationId);
                return std::unexpected(StoreError::ClaimLost);
            }

            if (record->version != token.snapshotVersion) {
                auto stmt = db_->prepare(R"(
                    UPDATE t_obscalc
                    SET c_state = 'pending', c_claimed_version = NULL,
                        c_failure_count = 0, c_retry_at = NULL
                    WHERE c_observation_id = ?
                )");
                stmt->bind(1, token.observationId);
                stmt->execute();
                outcome.newState = CalcState::Pending;
                outcome.superseded = true;
            } else {
                Timestamp lastUpdate =
                    std::max(computedAt, record->lastInvalidation);
                auto stmt = db_->prepare(R"(
                    UPDATE t_obscalc
                    SET c_state = 'ready', c_last_update = ?, c_result = ?,
                        c_claimed_version = NULL, c_failure_count = 0,
                        c_retry_at = NULL, c_error_message = NULL
                    WHERE c_observation_id = ?
                )");
                stmt->bind(1, toMicros(lastUpdate))
                    .bind(2, result.toJson().dump())
                    .bind(3, token.observationId);
                stmt->execute();
                outcome.newState = CalcState::Ready;
            }

            tx->commit();
            events.push_back(makeEvent(*record, CalcState::Calculating,
                                       outcome.newState, computedAt));
        }

        if (outcome.superseded) {
            SPDLOG_DEBUG("Result for {} superseded by a later invalidation",
                         token.observationId);
        } else {
            SPDLOG_DEBUG("Result for {} committed", token.observationId);
        }
        publish(events);
        return outcome;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Complete failed for {}: {}", token.observationId,
                     e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

auto CalcStore::fail(const ClaimToken& token, FailureKind kind,
                     const std::string& message, const RetryPolicy& policy,
                     Timestamp computedAt) -> StoreResult<StoreOutcome> {
    try {
        std::vector<CalcChangeEvent> events;
        StoreOutcome outcome;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);

            auto record = selectClaimed(token);
            if (!record) {
                SPDLOG_WARN("Fail rejected for {}: claim lost",
                            token.observationId);
                return std::unexpected(StoreError::ClaimLost);
            }

            if (record->version != token.snapshotVersion) {
                // New input arrived; the failure no longer applies
                auto stmt = db_->prepare(R"(
                    UPDATE t_obscalc
                    SET c_state = 'pending', c_claimed_version = NULL,
                        c_failure_count = 0, c_retry_at = NULL
                    WHERE c_observation_id = ?
                )");
                stmt->bind(1, token.observationId);
                stmt->execute();
                outcome.newState = CalcState::Pending;
                outcome.superseded = true;
            } else {
                auto decision =
                    policy.decide(kind, record->failureCount, computedAt);

                if (decision.state == CalcState::Retry) {
                    auto stmt = db_->prepare(R"(
                        UPDATE t_obscalc
                        SET c_state = 'retry', c_failure_count = ?,
                            c_retry_at = ?, c_claimed_version = NULL
                        WHERE c_observation_id = ?
                    )");
                    stmt->bind(1, decision.failureCount)
                        .bind(2, toMicros(*decision.retryAt))
                        .bind(3, token.observationId);
                    stmt->execute();
                    SPDLOG_WARN(
                        "Calculation for {} failed ({}), retry {} at {}",
                        token.observationId, message, decision.failureCount,
                        toMicros(*decision.retryAt));
                } else {
                    Timestamp lastUpdate =
                        std::max(computedAt, record->lastInvalidation);
                    auto stmt = db_->prepare(R"(
                        UPDATE t_obscalc
                        SET c_state = 'failed', c_failure_count = 0,
                            c_retry_at = NULL, c_claimed_version = NULL,
                            c_error_message = ?, c_last_update = ?,
                            c_result = NULL
                        WHERE c_observation_id = ?
                    )");
                    stmt->bind(1, message.empty()
                                      ? std::string("Calculation failed")
                                      : message)
                        .bind(2, toMicros(lastUpdate))
                        .bind(3, token.observationId);
                    stmt->execute();
                    SPDLOG_ERROR("Calculation for {} failed permanently: {}",
                                 token.observationId, message);
                }
                outcome.newState = decision.state;
            }

            tx->commit();
            events.push_back(makeEvent(*record, CalcState::Calculating,
                                       outcome.newState, computedAt));
        }

        publish(events);
        return outcome;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Fail failed for {}: {}", token.observationId, e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

auto CalcStore::release(const ClaimToken& token, Timestamp now)
    -> StoreResult<StoreOutcome> {
    try {
        std::vector<CalcChangeEvent> events;
        StoreOutcome outcome;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);

            auto record = selectClaimed(token);
            if (!record) {
                return std::unexpected(StoreError::ClaimLost);
            }

            auto stmt = db_->prepare(R"(
                UPDATE t_obscalc
                SET c_state = CASE WHEN c_retry_at IS NULL
                                   THEN 'pending' ELSE 'retry' END,
                    c_failure_count = CASE WHEN c_retry_at IS NULL
                                           THEN 0 ELSE c_failure_count END,
                    c_claimed_version = NULL
                WHERE c_observation_id = ?
            )");
            stmt->bind(1, token.observationId);
            stmt->execute();

            outcome.newState = record->retryAt ? CalcState::Retry
                                               : CalcState::Pending;
            outcome.superseded = record->version != token.snapshotVersion;

            tx->commit();
            events.push_back(makeEvent(*record, CalcState::Calculating,
                                       outcome.newState, now));
        }

        SPDLOG_INFO("Claim on {} released to {}", token.observationId,
                    calcStateToString(outcome.newState));
        publish(events);
        return outcome;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Release failed for {}: {}", token.observationId,
                     e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

// ==================== Maintenance ====================

auto CalcStore::remove(const ObservationId& observationId, Timestamp now)
    -> StoreResult<bool> {
    try {
        std::vector<CalcChangeEvent> events;
        bool removed = false;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);

            auto stmt = db_->prepare(
                "SELECT c_program_id, c_state FROM t_obscalc "
                "WHERE c_observation_id = ?");
            stmt->bind(1, observationId);
            if (stmt->step()) {
                CalcRecord gone;
                gone.observationId = observationId;
                gone.programId = stmt->getText(0);
                auto previous = calcStateFromString(stmt->getText(1));

                auto del = db_->prepare(
                    "DELETE FROM t_obscalc WHERE c_observation_id = ?");
                del->bind(1, observationId);
                del->execute();
                removed = db_->changes() == 1;

                if (removed) {
                    events.push_back(
                        makeEvent(gone, previous, std::nullopt, now));
                }
            }

            tx->commit();
        }

        if (removed) {
            SPDLOG_DEBUG("Record removed: {}", observationId);
        }
        publish(events);
        return removed;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Remove failed for {}: {}", observationId, e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

auto CalcStore::resetCalculating(Timestamp now) -> StoreResult<size_t> {
    try {
        std::vector<CalcChangeEvent> events;
        size_t count = 0;
        {
            std::unique_lock lock(mutex_);
            auto tx = db_->beginTransaction(TransactionMode::Immediate);

            auto select = db_->prepare(
                "SELECT c_observation_id, c_program_id, c_retry_at "
                "FROM t_obscalc WHERE c_state = 'calculating'");
            while (select->step()) {
                CalcRecord record;
                record.observationId = select->getText(0);
                record.programId = select->getText(1);
                CalcState next = select->isNull(2) ? CalcState::Pending
                                                   : CalcState::Retry;
                events.push_back(
                    makeEvent(record, CalcState::Calculating, next, now));
            }

            auto stmt = db_->prepare(R"(
                UPDATE t_obscalc
                SET c_state = CASE WHEN c_retry_at IS NULL
                                   THEN 'pending' ELSE 'retry' END,
                    c_failure_count = CASE WHEN c_retry_at IS NULL
                                           THEN 0 ELSE c_failure_count END,
                    c_claimed_version = NULL
                WHERE c_state = 'calculating'
            )");
            stmt->execute();
            count = static_cast<size_t>(db_->changes());

            tx->commit();
        }

        if (count > 0) {
            SPDLOG_INFO("Released {} abandoned calculation(s)", count);
        }
        publish(events);
        return count;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Reset of calculating records failed: {}", e.what());
        return std::unexpected(StoreError::Unavailable);
    }
}

}  // namespace obscalc::calc
