/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <tether/internal/coroutine_support.h>
#include <tether/internal/logger.h>
#include <tether/internal/error_codes.h>
#include <tether/internal/types.h>
#include <tether/internal/event.h>
#include <tether/internal/cancellation.h>
#include <tether/internal/tick_source.h>
#include <tether/internal/timeout_settings.h>
#include <tether/internal/collaborators.h>
#include <tether/internal/call_registry.h>
#include <tether/internal/transaction_lock.h>
#include <tether/internal/spinner_arbiter.h>
#include <tether/internal/call_manager.h>
