#pragma once

#include <QtCore/QString>

namespace common
{

// Installs the process-wide message handler. Call once from main before any
// worker thread starts.
void initLogging(bool verbose = false);

} // namespace common
