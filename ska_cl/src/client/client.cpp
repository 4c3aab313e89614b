/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/client.hpp"
#include "ska/log.hpp"
#include "ska/signer.hpp"

#include "ska/internal/utils.hpp"
#include "ska/internal/http_parser.hpp"
#include "ska/internal/http_low.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <memory>
#include <stdexcept>

namespace ska {

struct Client::Impl {
    ClientConfig cfg;
    std::unique_ptr<Signer> signer;

    // Keep-alive state
    std::mutex mtx;
    std::unique_ptr<internal::TcpConn> conn;
    int served_on_conn = 0;

    explicit Impl(const ClientConfig& c): cfg(c) {
        ska::set_log_file(cfg.log_file);
        std::string secret;
        if (!internal::hex_to_bytes(cfg.secret_hex, secret) || secret.size() < 16 || secret.size() > 64) {
            internal::secure_wipe(secret);
            throw std::invalid_argument("Client: secret_hex must be 32..128 hex chars");
        }
        SignerOptions so;
        so.scheme = cfg.scheme;
        so.timestamp_header = cfg.timestamp_header;
        signer = std::make_unique<Signer>(cfg.account, secret, so);
        internal::secure_wipe(secret);
    }

    ~Impl() {
        std::lock_guard<std::mutex> lk(mtx);
        close_conn_locked();
    }

    void close_conn_locked() {
        if (conn) {
            conn->close();
            conn.reset();
        }
        served_on_conn = 0;
    }

    bool ensure_conn_locked() {
        if (conn && served_on_conn < cfg.ka_max) return true;
        close_conn_locked();
        conn = std::make_unique<internal::TcpConn>();
        if (!conn->open(cfg)) { conn.reset(); return false; }
        served_on_conn = 0;
        return true;
    }

    bool recv_response_locked(HttpResponse& out) {
        std::string head;
        if (!conn->recv_until(head, "\r\n\r\n", (1u<<20))) return false;

        std::size_t hdr_end_off = 0;
        if (!internal::parse_http_response(head, hdr_end_off, out.status_code,
                                           out.status_text, out.headers)) return false;

        const std::string cl = internal::hdr_ci(out.headers, "Content-Length");
        if (cl.empty() || cl.size() > 12 ||
            !std::all_of(cl.begin(), cl.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
            return false;
        }
        const std::size_t content_len = (std::size_t)std::stoull(cl);

        out.body.clear();
        if (hdr_end_off < head.size()) {
            const char* p = head.data() + hdr_end_off;
            std::size_t have = head.size() - hdr_end_off;
            out.body.assign(p, p + std::min(have, content_len));
        }

        while (out.body.size() < content_len) {
            char buf[4096];
            const std::size_t need = content_len - out.body.size();
            ssize_t n = ::recv(conn->fd(), buf, std::min<std::size_t>(sizeof(buf), need), 0);
            if (n <= 0) return false;
            out.body.append(buf, buf + n);
        }

        const std::string connh = internal::lower_copy(internal::hdr_ci(out.headers, "Connection"));
        served_on_conn++;
        if (connh == "close" || served_on_conn >= cfg.ka_max) {
            close_conn_locked();
        }
        return true;
    }
};

Client::Client(const ClientConfig& cfg)
    : _p(std::make_unique<Client::Impl>(cfg)) {}

Client::~Client() = default;

bool Client::request(const std::string& method,
                     const std::string& path,
                     const internal::QueryParams& query,
                     const std::string& body,
                     HttpResponse& out)
{
    HttpRequest r;
    r.method  = internal::upper_copy(method);
    r.httpver = "HTTP/1.1";
    r.path    = _p->cfg.base_path;
    if (!r.path.empty() && r.path[0] != '/') r.path = "/" + r.path;
    r.path   += path;
    r.query   = internal::canonical_query_sorted(query);
    r.body    = body;
    r.headers.emplace_back("User-Agent", "ska-client/1");
    r.headers.emplace_back("Accept", "*/*");
    r.headers.emplace_back("Connection", "keep-alive");
    if (!body.empty()) {
        r.headers.emplace_back(kContentTypeHeader, _p->cfg.content_type);
    }

    if (!_p->signer->sign(r)) {
        ska::log_line("[CLIENT] failed to sign " + r.method + " " + r.path);
        return false;
    }
    const std::string wire = internal::serialize_request(r, _p->cfg.host);

    std::lock_guard<std::mutex> lk(_p->mtx);
    if (!_p->ensure_conn_locked()) return false;

    // A kept-alive connection may have been closed by the server; retry once
    // on a fresh one.
    const bool reused = _p->served_on_conn > 0;
    if (_p->conn->send_all(wire.data(), wire.size()) && _p->recv_response_locked(out)) {
        return true;
    }
    _p->close_conn_locked();
    if (!reused) return false;

    if (!_p->ensure_conn_locked()) return false;
    if (!_p->conn->send_all(wire.data(), wire.size())) {
        _p->close_conn_locked();
        return false;
    }
    if (!_p->recv_response_locked(out)) {
        _p->close_conn_locked();
        return false;
    }
    return true;
}

bool Client::whoami(HttpResponse& out) {
    return request("GET", "/whoami", /*query*/{}, "", out);
}

bool Client::post_echo(const std::string& payload, HttpResponse& out) {
    return request("POST", "/echo", /*query*/{}, payload, out);
}

} // namespace ska
