#pragma once

#include <QString>

namespace atrium::app {

// Installs a Qt message handler that writes "<time> <level> <category> <message>"
// lines to stderr and, if `path` is non-empty, appends them to that file.
void install_file_logging(const QString& path);

// Turns on debug output of the sync and harvest categories.
void enable_sync_debug_logging();

} // namespace atrium::app
