#pragma once

#include <string>
#include <string_view>

namespace gateway::common {

/// Replace the default logger with an asynchronous one writing to the
/// console and to log_file. Unknown level names fall back to info.
void install_logger(std::string_view name,
                    const std::string& level,
                    const std::string& log_file);

}  // namespace gateway::common
