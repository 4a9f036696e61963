// SPDX-License-Identifier: Apache-2.0
// Part of ktrest (Key Transparency REST front end) project.
// apps/ktrest_server.cpp

#include "ktrest/server.hpp"
#include "ktrest/server_config.hpp"
#include "ktrest/rest.hpp"
#include "ktrest/handlers.hpp"
#include "ktrest/memory_key_server.hpp"
#include "ktrest/log.hpp"

#include <iostream>
#include <string>
#include <stdexcept>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--port <n>] [--log_file <path>]\n"
         "  [--tls_cert <crt> --tls_key <key>]\n"
         "  [--tls_client_ca <ca.pem>] [--require_client_cert 0|1]\n"
         "  [--max_body <bytes>] [--ka_timeout <sec>] [--ka_max <n>]\n"
         "  [--redact_errors 0|1]\n"
         "  [--quiet 0|1]                    (suppress all console logs when 1)\n";
}

int main(int argc, char** argv) {
    ktrest::ServerConfig cfg;
    std::string log_file = "ktrest.log";
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i+1 < argc) {
                int p = std::stoi(argv[++i]);
                if (p <= 0 || p > 65535) throw std::out_of_range("port");
                cfg.port = (uint16_t)p;
            }
            else if (a == "--tls_cert" && i+1 < argc) cfg.tls_cert_file = argv[++i];
            else if (a == "--tls_key"  && i+1 < argc) cfg.tls_key_file  = argv[++i];
            else if (a == "--tls_client_ca" && i+1 < argc) cfg.tls_client_ca = argv[++i];
            else if (a == "--require_client_cert" && i+1 < argc) cfg.require_client_cert = (std::stoi(argv[++i]) != 0);
            else if (a == "--max_body" && i+1 < argc) cfg.max_body = (std::size_t)std::stoull(argv[++i]);
            else if (a == "--ka_timeout" && i+1 < argc) cfg.ka_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--ka_max" && i+1 < argc) cfg.ka_max = std::stoi(argv[++i]);
            else if (a == "--redact_errors" && i+1 < argc) cfg.redact_errors = (std::stoi(argv[++i]) != 0);
            else if (a == "--log_file" && i+1 < argc) log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::logic_error&) {
        // std::stoi and friends: invalid_argument / out_of_range
        usage(argv[0]);
        return 2;
    }

    if (cfg.tls_cert_file.empty() != cfg.tls_key_file.empty()) {
        std::cerr << "TLS requires both --tls_cert and --tls_key\n";
        return 2;
    }
    if (cfg.require_client_cert && cfg.tls_client_ca.empty()) {
        std::cerr << "--require_client_cert 1 requires --tls_client_ca\n";
        return 2;
    }
    if (cfg.ka_max <= 0 || cfg.ka_timeout_sec <= 0) {
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    ktrest::set_log_file(log_file);

    try {
        ktrest::MemoryKeyServer backend;
        ktrest::RestServer rest(backend, cfg.redact_errors);
        for (const auto& r : ktrest::v1_routes()) rest.add_handler(r);
        for (const auto& r : ktrest::v2_routes()) rest.add_handler(r);

        ktrest::Server srv(cfg, rest);
        srv.run();  // blocking
    } catch (const std::exception& e) {
        // With --quiet 1 only the log file receives this.
        ktrest::log_line(ktrest::LogLevel::Fatal, std::string("exception: ") + e.what());
        return 1;
    }
    return 0;
}
