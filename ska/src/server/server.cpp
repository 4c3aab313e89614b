/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/server.hpp"
#include "ska/shared_key_stage.hpp"
#include "ska/internal/http_server.hpp"
#include "ska/log.hpp"

#include <stdexcept>
#include <string>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace ska {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

static SharedKeyStageConfig stage_config(const ServerConfig& cfg, SecretStore& secrets) {
    SharedKeyStageConfig sc;
    sc.resolver            = secrets.resolver();
    sc.max_age             = std::chrono::seconds(cfg.max_age_sec);
    sc.clock_skew          = std::chrono::seconds(cfg.clock_skew_sec);
    sc.scheme              = cfg.scheme;
    sc.timestamp_header    = cfg.timestamp_header;
    sc.expired_status      = cfg.expired_status;
    sc.log_unknown_account = cfg.log_unknown_account;
    sc.redact_errors       = cfg.redact_errors;
    return sc;
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg)
    : _cfg(cfg)
{
    // --- Initialize secret backend (file or Redis) ---
    if (_cfg.auth_use_redis) {
        SecretStore::RedisOptions ropt;
        ropt.host          = _cfg.redis.host;
        ropt.port          = _cfg.redis.port;
        ropt.db            = _cfg.redis.db;
        ropt.password      = _cfg.redis.password;
        ropt.key_prefix    = _cfg.redis.key_prefix;
        ropt.pool_size     = _cfg.redis.pool_size;
        ropt.timeout_ms    = _cfg.redis.timeout_ms;
        ropt.cache_ttl_sec = _cfg.redis.cache_ttl_sec;
        ropt.cache_max_entries = _cfg.redis.cache_max_entries;

        if (!_secrets.init_redis(ropt)) {
            throw std::runtime_error("SecretStore: failed to init Redis backend");
        }
    } else {
        if (_cfg.auth_file.empty()) {
            throw std::runtime_error("SecretStore: auth_file is required when Redis is disabled");
        }
        if (!_secrets.init_file(_cfg.auth_file)) {
            throw std::runtime_error("SecretStore: failed to load auth_file");
        }
    }

    // SharedKeyStage validates the numeric options and throws
    // std::invalid_argument on bad values.
    _pipeline.add(std::make_shared<SharedKeyStage>(stage_config(_cfg, _secrets)));
}

Server::~Server() {
    stop();
    std::unique_lock<std::mutex> lk(_conn_mtx);
    _conn_cv.wait(lk, [this] { return _conns.empty(); });
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    int fd = _listen_fd.exchange(-1);
    if (fd >= 0) {
        // Unblocks accept() in run().
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
    // Wakes handlers blocked in recv(); each thread still closes its own fd.
    std::lock_guard<std::mutex> lk(_conn_mtx);
    for (int c : _conns) ::shutdown(c, SHUT_RDWR);
}

std::size_t Server::active_connections() const {
    std::lock_guard<std::mutex> lk(_conn_mtx);
    return _conns.size();
}

void Server::serve_connection(int fd, const std::string& peer) {
    internal::handle_connection_plain(fd, _cfg, peer, _pipeline);
    // Notify under the lock: ~Server may destroy _conn_cv once it reacquires.
    std::lock_guard<std::mutex> lk(_conn_mtx);
    _conns.erase(fd);
    ::close(fd);
    _conn_cv.notify_all();
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        ska::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    if (set_reuseaddr(srv) < 0) {
        ska::log_line(std::string("[WARN] SO_REUSEADDR failed: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(_cfg.port);

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ska::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (listen(srv, 512) < 0) {
        ska::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }
    sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        _bound_port.store(ntohs(bound.sin_port));
    }
    return srv;
}

void Server::run() {
    ska::log_line("[INFO] SharedKey server starting...");
    ska::log_line("[INFO] Port: " + std::to_string(_cfg.port));
    if (_cfg.auth_use_redis) {
        ska::log_line(std::string("[INFO] Secret backend: REDIS host=") + _cfg.redis.host +
                      ":" + std::to_string(_cfg.redis.port) +
                      " db=" + std::to_string(_cfg.redis.db) +
                      " prefix=" + _cfg.redis.key_prefix);
    } else {
        ska::log_line("[INFO] Secret backend: FILE " + _cfg.auth_file +
                      " accounts=" + std::to_string(_secrets.file_entries()));
    }
    ska::log_line("[INFO] Scheme: " + _cfg.scheme +
                  " timestamp_header=" + _cfg.timestamp_header);
    ska::log_line("[INFO] Freshness: max_age=" + std::to_string(_cfg.max_age_sec) +
                  "s, clock_skew=" + std::to_string(_cfg.clock_skew_sec) +
                  "s, expired_status=" + std::to_string(_cfg.expired_status));
    if (_cfg.redact_errors) {
        ska::log_line("[INFO] Error redaction: ENABLED");
    }
    ska::log_line("[INFO] KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                  "s, KA max=" + std::to_string(_cfg.ka_max));

    int srv = create_listen_socket();
    _listen_fd.store(srv);
    if (_stop.load(std::memory_order_relaxed)) {
        stop();
        return;
    }
    ska::log_line(std::string("[INFO] Listening HTTP on :") + std::to_string(port()));

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            // transient error; continue
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        {
            std::lock_guard<std::mutex> lk(_conn_mtx);
            if (_stop.load(std::memory_order_relaxed)) {
                ::close(fd);
                break;
            }
            _conns.insert(fd);
        }
        // Detached; ~Server waits for _conns to drain.
        try {
            std::thread([this, fd, peer]() { serve_connection(fd, peer); }).detach();
        } catch (const std::system_error& e) {
            ska::log_line(std::string("[WARN] connection thread failed: ") + e.what());
            std::lock_guard<std::mutex> lk(_conn_mtx);
            _conns.erase(fd);
            ::close(fd);
        }
    }

    // stop() may have closed it already
    int fd = _listen_fd.exchange(-1);
    if (fd >= 0) ::close(fd);
    ska::log_line("[INFO] Server stopped");
}

} // namespace ska
