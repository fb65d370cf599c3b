//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   implementations.hpp
 *
 * @brief  Collection of all LogWriter implementations in a single include file
 */

#pragma once

#include "journald.hpp"
#include "streamwriter.hpp"
#include "syslog.hpp"
