// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace waypoint {

/// $XDG_DATA_HOME, else ~/.local/share, else /tmp
std::string xdg_data_home();

/// Per-user data directory ($XDG_DATA_HOME/waypoint); not created
std::string data_dir();

} // namespace waypoint
