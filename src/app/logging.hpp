#pragma once

#include <QString>

namespace vaultsync::app {

// Installs a Qt message handler that appends timestamped lines to the log
// file. Warnings and worse are also echoed to stderr.
void install_file_logging();

// <AppLocalData>/logs/vaultsync.log, or empty if no writable location exists.
QString default_log_file_path();

} // namespace vaultsync::app
