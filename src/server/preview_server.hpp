#ifndef PREVIEW_SERVER_HPP
#define PREVIEW_SERVER_HPP

#include "server.hpp"
#include <filesystem>
#include <string>

class SiteBuilder;

namespace fs = std::filesystem;

// Maps <output_root><request path> to a file; missing files get a 404 page.
void serve_output_file(const fs::path &output_root, const Request &req,
                       Response &res);

void configure_preview_routes(Server &svr, const fs::path &output_root);

// Binds the first free port starting at `port`. Throws std::runtime_error
// when binding fails for any reason other than the port being taken.
int bind_with_retry(Server &svr, const std::string &host, int port);

// Serves until SIGINT/SIGTERM.
void run_until_signalled(Server &svr);

// Build once, then serve the output directory.
void start_preview_server(SiteBuilder &builder);

#endif
