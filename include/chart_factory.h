// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart.h"

#include <memory>

namespace chartkit {

/// New chart of the given variant with default styling
std::unique_ptr<Chart> create_chart(ChartType type);

} // namespace chartkit
