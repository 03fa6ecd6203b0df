#pragma once

#include <QString>

namespace tidemark {

// $TIDEMARK_SOCKET_NAME, else <runtime dir>/tidemark.sock.
QString daemonSocketPath();

bool isDaemonRunning();
// Launches tidemark-daemon detached: a sibling binary first, then the
// systemd user unit, then PATH.
bool startDaemon();

} // namespace tidemark
