#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace chipper {

using Logger = std::shared_ptr<spdlog::logger>;

/**
 * Get or create the named logger
 *
 * Loggers are registered globally by tag, so components created many times
 * share one instance.
 *
 * @param tag  Name shown in every line, e.g. "Tokenizer"
 */
Logger create_logger(const std::string& tag);

// Raise every chipper logger to debug (true) or back to info (false).
void set_verbose_logging(bool verbose);

} // namespace chipper
