/**
 * @file    logging.hpp
 * @brief   spdlog default logger setup
 * @author  AllenK (Kwyshell)
 * @date    2026.10.01
 * @license MIT
 */

#pragma once

#include "config/app_config.hpp"

namespace wit {

/**
 * Install a colored console sink (stderr) plus an optional file sink as the
 * default spdlog logger. Unknown level names fall back to info.
 */
void setup_logging(const LogConfig& config);

}  // namespace wit
