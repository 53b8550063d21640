#pragma once

#include <functional>
#include <string>

#include <dpp/misc-enum.h>

namespace encore {

/// Log sink handed to every component. main() forwards it to dpp::cluster::log
/// so everything ends up in the same on_log handler.
using log_fn = std::function<void(dpp::loglevel, const std::string&)>;

} // namespace encore
