/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/internal/http_server.hpp"
#include "ska/internal/http_parser.hpp"
#include "ska/internal/utils.hpp"
#include "ska/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ska::internal {

// --- HTTP/1.1 keep-alive helpers ---

static bool should_keep_alive(const ska::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (R.httpver == "HTTP/1.1") {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

// --- I/O helpers ---

static bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back((char)c);
                }
        }
    }
    return out;
}

std::string serialize_response(const ska::ServerConfig& cfg,
                               const ska::HttpResponse& resp,
                               bool keep_alive)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status_code << " " << resp.status_text << "\r\n";
    for (const auto& kv : resp.headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "Content-Length: " << resp.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    oss << resp.body;
    return oss.str();
}

// Reads one request. `buf` carries bytes already received past the
// previous request on this connection.
static bool recv_http_request(int fd,
                              const ska::ServerConfig& cfg,
                              std::string& buf,
                              ska::HttpRequest& R)
{
    char chunk[4096];
    std::size_t hdr_end = buf.find("\r\n\r\n");
    while (hdr_end == std::string::npos) {
        if (buf.size() > cfg.max_header) return false; // header abuse guard
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return false;
        buf.append(chunk, chunk + n);
        hdr_end = buf.find("\r\n\r\n");
    }
    if (hdr_end > cfg.max_header) return false;

    const std::string hdrs = buf.substr(0, hdr_end);
    const std::size_t line_end = hdrs.find("\r\n");
    const std::string first = hdrs.substr(0, line_end);
    if (!parse_request_line(first, R)) return false;
    if (line_end != std::string::npos) {
        if (!parse_header_block(hdrs.substr(line_end + 2), R.headers)) return false;
    } else {
        R.headers.clear();
    }

    // Only Content-Length framing is supported.
    if (!hdr_ci(R, "Transfer-Encoding").empty()) return false;
    if (hdr_ci_all(R.headers, "Content-Length").size() > 1) return false;

    std::size_t content_len = 0;
    const std::string cl = hdr_ci(R, "Content-Length");
    if (!cl.empty()) {
        const bool digits = std::all_of(cl.begin(), cl.end(),
                                        [](unsigned char c){ return std::isdigit(c) != 0; });
        if (!digits || cl.size() > 12) return false;
        content_len = static_cast<std::size_t>(std::stoull(cl));
        if (content_len > cfg.max_body) return false;
    }

    buf.erase(0, hdr_end + 4);
    while (buf.size() < content_len) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return false;
        buf.append(chunk, chunk + n);
    }
    R.body.assign(buf, 0, content_len);
    buf.erase(0, content_len);
    return true;
}

// --- Routing ---

ska::HttpResponse app_routes(const ska::HttpRequest& R, ska::RequestContext& ctx) {
    if (R.path == "/whoami" && R.method == "GET") {
        if (!ctx.identity) {
            // The pipeline is misconfigured if this happens.
            return ska::make_response(500, "Internal Server Error",
                                      R"({"status":"ERROR","reason":"NO_IDENTITY"})");
        }
        std::ostringstream os;
        os << R"({"status":"OK","account":")" << json_escape(ctx.identity->account)
           << R"(","claims":[)";
        bool first = true;
        for (const auto& c : ctx.identity->claims) {
            if (!first) os << ",";
            first = false;
            os << R"({"name":")" << json_escape(c.first)
               << R"(","value":")" << json_escape(c.second) << R"("})";
        }
        os << "]}";
        return ska::make_response(200, "OK", os.str());
    }
    if (R.path == "/echo" && R.method == "POST") {
        std::ostringstream os;
        os << R"({"status":"OK","echo_size":)" << R.body.size() << "}";
        return ska::make_response(200, "OK", os.str());
    }
    return ska::make_response(404, "Not Found", R"({"status":"ERROR","reason":"NOT_FOUND"})");
}

ska::HttpResponse route_request(const ska::ServerConfig& /*cfg*/,
                                const ska::Pipeline& pipeline,
                                const ska::HttpRequest& R)
{
    if (R.path == "/health") {
        return ska::make_response(200, "OK", R"({"status":"OK"})");
    }
    if (R.method != "GET" && R.method != "POST") {
        return ska::make_response(405, "Method Not Allowed",
                                  R"({"status":"ERROR","reason":"ONLY_GET_OR_POST"})");
    }

    ska::RequestContext ctx;
    return pipeline.run(R, ctx, app_routes);
}

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const ska::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const ska::Pipeline& pipeline)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::string buf;
    int served = 0;
    while (served < cfg.ka_max) {
        ska::HttpRequest R;
        if (!recv_http_request(fd, cfg, buf, R)) break;

        ska::HttpResponse resp;
        try {
            resp = route_request(cfg, pipeline, R);
        } catch (const std::exception& e) {
            ska::log_line(std::string("[500] ip=") + peer_ip + " error=" + e.what());
            resp = ska::make_response(500, "Internal Server Error",
                                      R"({"status":"ERROR","reason":"INTERNAL_ERROR"})");
        }
        ++served;
        const bool ka = should_keep_alive(R) && served < cfg.ka_max;
        const std::string out = serialize_response(cfg, resp, ka);
        if (!send_all(fd, out.data(), out.size())) break;
        ska::log_line("[" + std::to_string(resp.status_code) + "] ip=" + peer_ip +
                      " " + R.method + " " + R.path);
        if (!ka) break;
    }
}

} // namespace ska::internal
