/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <string>
#include "hs/server_config.hpp"
#include "hs/verifier.hpp"

namespace hs::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside).
// Takes ownership of fd and closes it before returning.
void handle_connection_plain(int fd,
                             const hs::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const hs::Verifier& verifier);

} // namespace hs::internal
