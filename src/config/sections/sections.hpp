// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#ifndef OBSCALC_CONFIG_SECTIONS_SECTIONS_HPP
#define OBSCALC_CONFIG_SECTIONS_SECTIONS_HPP

#include "database_config.hpp"
#include "logging_config.hpp"
#include "notifier_config.hpp"
#include "retry_config.hpp"
#include "worker_config.hpp"

#endif  // OBSCALC_CONFIG_SECTIONS_SECTIONS_HPP
