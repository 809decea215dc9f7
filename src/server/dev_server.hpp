#ifndef DEV_SERVER_HPP
#define DEV_SERVER_HPP

#include <string>

// Forward declarations
class SiteBuilder;
class Server;
class WatchOrchestrator;

// Starts the watcher, then binds the server. If no port can be bound the
// watcher is stopped before the error propagates. Returns the bound port.
int start_watch_and_bind(WatchOrchestrator &watcher, Server &svr,
                         const std::string &host, int port);

// Build, watch the content directory and serve the output directory. The
// watcher is stopped if the server cannot start.
void start_dev_server(SiteBuilder &builder);

#endif // DEV_SERVER_HPP
