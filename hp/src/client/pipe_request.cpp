/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#include "hp/pipe.hpp"
#include "hp/log.hpp"
#include "hp/internal/http_encoder.hpp"
#include "hp/internal/utils.hpp"

#include <utility>

namespace hp {

void Pipe::reset_cycle() {
    _state = State::NotReady;
    _read_line = nullptr;
    _read_timeout_ms = 0;
    _remaining = 0;
    _chunked = false;
    _keepalive = true;
    _peer_closed = false;
    _released = false;
    _method.clear();
    _eof = false;
}

bool Pipe::request(const std::vector<std::string>& target, const RequestOptions& opts,
                   HttpResponse& out, Error& err)
{
    Endpoint ep;
    if (!parse_endpoint(target, ep, err)) return false;
    return request(ep, opts, out, err);
}

bool Pipe::request(const std::string& host, std::uint16_t port, const RequestOptions& opts,
                   HttpResponse& out, Error& err)
{
    Endpoint ep;
    ep.host = host;
    ep.port = port;
    return request(ep, opts, out, err);
}

bool Pipe::request(const Endpoint& ep, const RequestOptions& opts,
                   HttpResponse& out, Error& err)
{
    if (!_sock) { err.set(Errc::NotInitialized, ""); return false; }

    if (opts.version != 0 && opts.version != 1) {
        err.set(Errc::InvalidVersion, "version " + std::to_string(opts.version));
        return false;
    }

    reset_cycle();

    _sock->set_timeout(opts.connect_timeout_ms > 0 ? opts.connect_timeout_ms
                                                   : kDefaultConnectTimeoutMs);
    if (!_sock->connect(ep, err)) {
        log_line("[PIPE] connect to " + ep.pool_key() + " failed: " + describe(err));
        return false;
    }

    if (opts.send_timeout_ms > 0) _sock->set_timeout(opts.send_timeout_ms);
    if (opts.read_timeout_ms > 0) _read_timeout_ms = opts.read_timeout_ms;
    _ka = opts.keepalive;

    internal::EncodedRequest enc;
    if (!internal::encode_request(opts, ep.is_unix() ? "localhost" : ep.host, enc, err)) {
        return false;
    }
    _method = enc.method;

    if (!_sock->send(enc.head.data(), enc.head.size(), err)) return false;
    if (!send_body(opts, enc.headers, err)) return false;

    _state = State::Begin;

    if (opts.stream == StreamMode::Full) {
        out = HttpResponse{};
        return true;
    }

    ResponseFilters filters;
    if (opts.stream == StreamMode::Body) {
        filters.header_filter = [](int, const HeaderMap&) { return true; };
    }
    return response(filters, out, err);
}

bool Pipe::send_body(const RequestOptions& opts, const HeaderMap& headers, Error& err) {
    if (opts.body) {
        if (opts.body->empty()) return true;
        return _sock->send(opts.body->data(), opts.body->size(), err);
    }
    if (!opts.body_producer) return true;

    std::uint64_t budget = 0;
    const auto cl = headers.get("Content-Length");
    if (!cl || !internal::parse_decimal(*cl, budget)) budget = 0;

    const std::uint64_t declared = budget;
    std::string chunk;
    while (budget > 0) {
        chunk.clear();
        if (!opts.body_producer(chunk) || chunk.empty()) break;
        if (chunk.size() > budget) chunk.resize(static_cast<std::size_t>(budget));
        if (!_sock->send(chunk.data(), chunk.size(), err)) return false;
        budget -= chunk.size();
    }

    if (budget > 0) {
        err.set(Errc::ShortRequestBody,
                "sent " + std::to_string(declared - budget) + " of " +
                std::to_string(declared) + " declared bytes");
        log_line("[PIPE] " + err.message + ", closing connection");

        // The peer is still waiting for the rest of the body.
        _eof = true;
        _released = true;
        Error close_err;
        if (!_sock->close(close_err)) {
            log_line("[PIPE] close failed: " + describe(close_err));
        }
        return false;
    }
    return true;
}

bool Pipe::response(HttpResponse& out, Error& err) {
    return response(ResponseFilters{}, out, err);
}

bool Pipe::response(const ResponseFilters& filters, HttpResponse& out, Error& err) {
    if (!_sock) { err.set(Errc::NotInitialized, ""); return false; }

    int status = 0;
    HeaderMap headers;
    std::string body;

    Event ev;
    bool stop = false;
    while (!_eof && !stop) {
        if (!read(ev, err)) return false;

        switch (ev.type) {
        case EventType::StatusLine:
            status = ev.status;
            break;
        case EventType::Header:
            if (!ev.header.name.empty()) headers.append(ev.header.name, ev.header.value);
            break;
        case EventType::HeaderEnd:
            if (filters.header_filter && filters.header_filter(status, headers)) stop = true;
            break;
        case EventType::Body:
            if (filters.body_filter) {
                if (filters.body_filter(ev.data)) stop = true;
            } else {
                body += ev.data;
            }
            break;
        case EventType::BodyEnd:
            break;
        case EventType::Eof:
            stop = true;
            break;
        }
    }

    out.status  = status;
    out.headers = std::move(headers);
    out.body    = std::move(body);
    out.eof     = _eof;
    return true;
}

} // namespace hp
