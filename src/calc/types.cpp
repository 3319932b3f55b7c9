// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "types.hpp"

namespace obscalc::calc {

std::optional<CalcState> calcStateFromString(std::string_view str) noexcept {
    if (str == "pending") return CalcState::Pending;
    if (str == "retry") return CalcState::Retry;
    if (str == "calculating") return CalcState::Calculating;
    if (str == "ready") return CalcState::Ready;
    if (str == "failed") return CalcState::Failed;
    return std::nullopt;
}

}  // namespace obscalc::calc
