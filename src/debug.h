// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#ifndef WP_CRON_RUNNER_DEBUG_H
#define WP_CRON_RUNNER_DEBUG_H

#include <stdbool.h>

#ifdef NDEBUG
static const bool debug_mode = false;
#else
extern bool debug_mode;
#endif

#endif
