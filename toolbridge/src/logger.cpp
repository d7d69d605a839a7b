#include "logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("toolbridge"));
	return logger;
}

log4cplus::Logger& dispatch_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("toolbridge.dispatch"));
	return logger;
}

log4cplus::Logger& transport_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("toolbridge.transport"));
	return logger;
}

log4cplus::Logger& tool_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("toolbridge.tools"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}

	std::error_code ec;
	std::filesystem::path cwd = std::filesystem::current_path(ec);
	if (ec) {
		return path;
	}
	return cwd / path;
}

void init_logging(const std::string& config_path) {
	std::error_code ec;
	auto resolved = resolve_config_path(config_path);
	if (!config_path.empty() && std::filesystem::exists(resolved, ec)) {
		std::filesystem::create_directories("logs", ec);
		if (ec) {
			log4cplus::helpers::LogLog::getLogLog()->warn(
				LOG4CPLUS_TEXT("Failed to create logs directory: ") + LOG4CPLUS_STRING_TO_TSTRING(ec.message()));
		}
		log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
		return;
	}

	// stdout belongs to the protocol channel, so the fallback console logs to stderr
	log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}
