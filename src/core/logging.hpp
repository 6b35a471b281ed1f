#pragma once

#include <string>

/// Install a file logger named "imagetea" as spdlog's default logger.
/// The terminal belongs to the frame renderer, so nothing is logged to the
/// console. Falls back to a null sink when path cannot be opened.
/// Returns false on fallback.
bool init_logging(const std::string& path, const std::string& level);

/// Parse "trace".."critical"/"off"; unknown names map to info.
int parse_log_level(const std::string& level);
