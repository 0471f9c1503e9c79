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

namespace hs {

// Thread-safe logging (to stdout, and to a file once set_log_file is called).
// An empty path turns file output off again.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

} // namespace hs
