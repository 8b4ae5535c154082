#pragma once

#include <string>
#include <string_view>

namespace webframe::bridge {

// Installs `window.webframe` (invoke, listen, emit, __receive). Safe to run more than once per page.
const std::string& InitScript();

// Script that hands `message` to `window.webframe.__receive` as a string.
std::string ReceiveScript(std::string_view message);

}  // namespace webframe::bridge
