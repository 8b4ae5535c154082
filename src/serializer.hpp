#pragma once

#include "events.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace webframe {

// Renders `event` as a JSON object whose first key is the `type` discriminator.
std::string Serialize(const Event& event);

std::string SerializeMonitor(const Monitor& monitor);
std::string SerializeMonitors(const std::vector<Monitor>& monitors);

// `value` as a JSON string literal, quotes included.
std::string QuoteJson(std::string_view value);

}  // namespace webframe
