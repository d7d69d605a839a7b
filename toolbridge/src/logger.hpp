#pragma once

#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& dispatch_logger();
log4cplus::Logger& transport_logger();
log4cplus::Logger& tool_logger();
void init_logging(const std::string& config_path);
