/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <condition_variable>
#include <mutex>
#include <unordered_set>
#include "ska/pipeline.hpp"
#include "ska/secret_store.hpp"
#include "ska/server_config.hpp"

namespace ska {

// Plain HTTP/1.1 host that runs every request through a SharedKey pipeline.
class Server {
public:
    // Throws std::runtime_error when the secret store cannot be initialised.
    explicit Server(const ServerConfig& cfg);
    // Stops and waits for every connection thread to finish. run() must
    // have returned before the Server is destroyed.
    ~Server();

    // Blocking run: create socket, listen and accept.
    void run();

    // Closes the listening socket and shuts down open connections; run()
    // returns after the current accept.
    void stop();

    // Bound port once run() is listening, 0 before.
    uint16_t port() const { return _bound_port.load(); }
    std::size_t active_connections() const;

    const Pipeline& pipeline() const { return _pipeline; }

private:
    ServerConfig _cfg;
    SecretStore _secrets;
    Pipeline _pipeline;
    std::atomic<bool> _stop{false};
    std::atomic<int> _listen_fd{-1};
    std::atomic<uint16_t> _bound_port{0};

    // fds owned by live connection threads
    mutable std::mutex _conn_mtx;
    std::condition_variable _conn_cv;
    std::unordered_set<int> _conns;

    int create_listen_socket();
    void serve_connection(int fd, const std::string& peer);
};

} // namespace ska
