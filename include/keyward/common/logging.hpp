#pragma once

#include <keyward/common/config.hpp>

namespace keyward::common {

/// Installs the async default logger (stdout color sink and file sink).
void setup_logging(const logging_config& options);

}  // namespace keyward::common
