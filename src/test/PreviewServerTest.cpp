#include <arpa/inet.h>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "server/preview_server.hpp"
#include "server/server.hpp"

namespace fs = std::filesystem;

static Request get(const std::string &path) {
    return Server::parse_request("GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n");
}

int main() {
    std::cout << "[Test] Starting PreviewServer Test..." << std::endl;

    fs::path root = fs::temp_directory_path() / "quire_preview_test";
    fs::remove_all(root);
    fs::create_directories(root / "posts");
    std::ofstream(root / "posts/hello.html") << "<h1>Hello</h1>";
    std::ofstream(root / "index.html") << "<h1>Home</h1>";
    fs::create_symlink("looping.html", root / "posts/looping.html");

    Server svr;
    configure_preview_routes(svr, root);

    // Request parsing.
    {
        Request req = get("/posts/hello.html?x=1");
        assert(req.method == "GET");
        assert(req.path == "/posts/hello.html?x=1");
        assert(req.version == "HTTP/1.1");
        assert(req.headers.at("Host") == "localhost");
    }

    // Existing files are served as HTML.
    {
        Response res = svr.dispatch(get("/posts/hello.html"));
        assert(res.status == 200);
        assert(res.body == "<h1>Hello</h1>");
        assert(res.headers.at("Content-Type") == "text/html");

        Response with_query = svr.dispatch(get("/posts/hello.html?utm=1"));
        assert(with_query.status == 200);

        Response home = svr.dispatch(get("/"));
        assert(home.status == 200);
        assert(home.body == "<h1>Home</h1>");
    }

    // Missing files are a 404 with an HTML body, never a 500, even when the
    // lookup itself fails (name too long, symlink loop).
    {
        const std::vector<std::string> paths = {
            "/posts/nope.html",
            "/nope",
            "/posts/",
            "/../etc/passwd",
            "/posts/../../x",
            "/posts/" + std::string(300, 'a') + ".html",
            "/posts/looping.html",
        };
        for (const auto &path : paths) {
            Response res = svr.dispatch(get(path));
            assert(res.status == 404);
            assert(res.headers.at("Content-Type") == "text/html");
            assert(res.body.find("<h1>") != std::string::npos);
        }
    }

    // Handler exceptions become a 500 carrying the message.
    {
        Server failing;
        failing.Get("/boom", [](const Request &, Response &) { throw std::runtime_error("kaboom"); });
        Response res = failing.dispatch(get("/boom"));
        assert(res.status == 500);
        assert(res.body.find("kaboom") != std::string::npos);

        assert(res.to_http().rfind("HTTP/1.1 500 Internal Server Error\r\n", 0) == 0);
    }

    // An occupied port is skipped.
    {
        int blocker = socket(AF_INET, SOCK_STREAM, 0);
        assert(blocker >= 0);

        int occupied = -1;
        for (int port = 38471; port < 38571; ++port) {
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(static_cast<uint16_t>(port));
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            if (bind(blocker, (sockaddr *)&addr, sizeof(addr)) == 0 && listen(blocker, 1) == 0) {
                occupied = port;
                break;
            }
        }
        assert(occupied != -1);

        Server retrying;
        int bound = bind_with_retry(retrying, "127.0.0.1", occupied);
        assert(bound > occupied);
        assert(retrying.get_bound_port() == bound);
        retrying.stop();
        close(blocker);
    }

    // An unusable listen address is an error, not a retry.
    {
        Server bogus;
        bool threw = false;
        try {
            bind_with_retry(bogus, "bogus", 38600);
        } catch (const std::runtime_error &) {
            threw = true;
        }
        assert(threw);
    }

    // stop() is not held up by a client that connects and never sends.
    {
        Server serving;
        configure_preview_routes(serving, root);
        int port = bind_with_retry(serving, "127.0.0.1", 38611);

        std::atomic<bool> finished{false};
        std::thread server_thread([&] {
            serving.listen_after_bind();
            finished = true;
        });

        int client = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        assert(connect(client, (sockaddr *)&addr, sizeof(addr)) == 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        serving.stop();

        int waited = 0;
        while (!finished.load() && waited < 10000) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            waited += 50;
        }
        assert(finished.load() && "server loop should exit after stop()");
        server_thread.join();
        close(client);
    }

    fs::remove_all(root);
    std::cout << "[PASS] PreviewServer Test." << std::endl;
    return 0;
}
