// SPDX-License-Identifier: Apache-2.0
// Part of the HTTPipe (HP) project.
// apps/hp_fetch_cli.cpp

#include "hp/pipe.hpp"
#include "hp/log.hpp"

#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <algorithm>
#include <iomanip>
#include <stdexcept>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " [--host 127.0.0.1 --port 80 | --unix /path/to.sock]\n"
      "      [--method GET] [--path /] [--query k=v]... [--header 'Name: value']...\n"
      "      [--data STRING] [--http10 0|1] [--stream none|full|body]\n"
      "\n"
      "Timeouts (milliseconds):\n"
      "  --connect_timeout <ms>   connect timeout (default 5000)\n"
      "  --send_timeout <ms>      send timeout\n"
      "  --read_timeout <ms>      per-read timeout\n"
      "\n"
      "Keepalive:\n"
      "  --repeat <n>             issue n requests on the same pipe (default 1)\n"
      "  --chunk_size <bytes>     body read size (default 8192)\n"
      "\n"
      "Logging:\n"
      "  --log_file <path>        append log lines to a file\n"
      "  --quiet 0|1              no log echo on stdout\n";
}

static void print_response(const hp::HttpResponse& resp, bool with_body){
    std::cout << "HTTP " << resp.status << "\n";
    for (const auto& e : resp.headers){
        for (const auto& v : e.values) std::cout << e.name << ": " << v << "\n";
    }
    if (with_body) std::cout << "\n" << resp.body << "\n";
}

// Print every parser event until eof.
static bool dump_events(hp::Pipe& pipe, hp::Error& err){
    hp::Event ev;
    for (;;) {
        if (!pipe.read(ev, err)) return false;
        switch (ev.type) {
        case hp::EventType::StatusLine: std::cout << "[statusline] " << ev.status << "\n"; break;
        case hp::EventType::Header:     std::cout << "[header] " << ev.header.raw << "\n"; break;
        case hp::EventType::HeaderEnd:  std::cout << "[header_end]\n"; break;
        case hp::EventType::Body:       std::cout << "[body] " << ev.data.size() << " bytes\n"; break;
        case hp::EventType::BodyEnd:    std::cout << "[body_end]\n"; break;
        case hp::EventType::Eof:        std::cout << "[eof]\n"; return true;
        }
    }
}

int main(int argc, char** argv){
    std::string host = "127.0.0.1";
    std::string port = "80";
    std::string unix_path;
    std::string stream = "none";
    std::string log_file;
    bool quiet = false;
    int repeat = 1;
    std::size_t chunk_size = hp::kDefaultChunkSize;

    hp::RequestOptions opts;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--host" && i+1<argc) host = argv[++i];
            else if(a=="--port" && i+1<argc) port = argv[++i];
            else if(a=="--unix" && i+1<argc) unix_path = argv[++i];
            else if(a=="--method" && i+1<argc) opts.method = argv[++i];
            else if(a=="--path" && i+1<argc) opts.path = argv[++i];
            else if(a=="--query" && i+1<argc) {
                std::string kv = argv[++i];
                std::size_t eq = kv.find('=');
                if (eq == std::string::npos) opts.query_args.emplace_back(kv, "");
                else opts.query_args.emplace_back(kv.substr(0, eq), kv.substr(eq+1));
            }
            else if(a=="--header" && i+1<argc) {
                std::string h = argv[++i];
                std::size_t c = h.find(':');
                if (c == std::string::npos) { usage(argv[0]); return 2; }
                std::size_t v = h.find_first_not_of(' ', c+1);
                opts.headers.append(h.substr(0, c), v == std::string::npos ? "" : h.substr(v));
            }
            else if(a=="--data" && i+1<argc) opts.body = std::string(argv[++i]);
            else if(a=="--http10" && i+1<argc) opts.version = (std::stoi(argv[++i])!=0) ? 0 : 1;
            else if(a=="--stream" && i+1<argc) stream = argv[++i];
            else if(a=="--connect_timeout" && i+1<argc) opts.connect_timeout_ms = std::max(1, std::stoi(argv[++i]));
            else if(a=="--send_timeout" && i+1<argc)    opts.send_timeout_ms    = std::max(1, std::stoi(argv[++i]));
            else if(a=="--read_timeout" && i+1<argc)    opts.read_timeout_ms    = std::max(1, std::stoi(argv[++i]));
            else if(a=="--repeat" && i+1<argc) repeat = std::max(1, std::stoi(argv[++i]));
            else if(a=="--chunk_size" && i+1<argc) chunk_size = (std::size_t)std::max(1, std::stoi(argv[++i]));
            else if(a=="--log_file" && i+1<argc) log_file = argv[++i];
            else if(a=="--quiet" && i+1<argc) quiet = (std::stoi(argv[++i])!=0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    if(stream=="none") opts.stream = hp::StreamMode::None;
    else if(stream=="full") opts.stream = hp::StreamMode::Full;
    else if(stream=="body") opts.stream = hp::StreamMode::Body;
    else { usage(argv[0]); return 2; }

    hp::set_log_quiet(quiet);
    if (!log_file.empty()) hp::set_log_file(log_file);

    std::vector<std::string> target;
    if (!unix_path.empty()) target.push_back("unix:" + unix_path);
    else { target.push_back(host); target.push_back(port); }

    hp::Pipe pipe(chunk_size);

    for (int n = 0; n < repeat; ++n) {
        hp::Error err;
        hp::HttpResponse resp;

        const auto t0 = std::chrono::steady_clock::now();
        if (!pipe.request(target, opts, resp, err)) {
            std::cerr << "request() failed: " << hp::describe(err) << "\n";
            return 1;
        }

        int reused = 0;
        if (!pipe.get_reused_times(reused, err)) {
            std::cerr << "get_reused_times() failed: " << hp::describe(err) << "\n";
            return 1;
        }

        if (opts.stream == hp::StreamMode::Full) {
            if (!dump_events(pipe, err)) {
                std::cerr << "read() failed: " << hp::describe(err) << "\n";
                return 1;
            }
        } else if (opts.stream == hp::StreamMode::Body) {
            print_response(resp, false);
            std::cout << "\n";
            std::string chunk;
            bool done = false;
            while (!done) {
                if (!pipe.read_body(chunk, done, err)) {
                    std::cerr << "read_body() failed: " << hp::describe(err) << "\n";
                    return 1;
                }
                std::cout << chunk;
            }
            std::cout << "\n";
        } else {
            print_response(resp, true);
        }

        const auto t1 = std::chrono::steady_clock::now();
        const double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
        hp::log_line("[CLI] request " + std::to_string(n + 1) + " reused=" + std::to_string(reused) +
                     " keepalive=" + (pipe.keepalive() ? "1" : "0"));
        std::cerr << "time: " << std::fixed << std::setprecision(3) << ms << " ms\n";
    }
    return 0;
}
