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
#include "hp/internal/http_parser.hpp"
#include "hp/internal/tcp_transport.hpp"
#include "hp/internal/utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace hp {

using internal::iequals;

Pipe::Pipe(std::size_t chunk_size)
    : _sock(std::make_unique<internal::TcpTransport>()),
      _size(chunk_size ? chunk_size : kDefaultChunkSize) {}

Pipe::Pipe(std::unique_ptr<Transport> transport, std::size_t chunk_size)
    : _sock(std::move(transport)),
      _size(chunk_size ? chunk_size : kDefaultChunkSize) {}

Pipe::~Pipe() = default;

bool Pipe::set_timeout(int ms, Error& err) {
    if (!_sock) { err.set(Errc::NotInitialized, ""); return false; }
    _sock->set_timeout(ms);
    return true;
}

// --- state machine ---

Pipe::Handler Pipe::handler_for(State s) {
    switch (s) {
    case State::Begin:         return &Pipe::read_statusline;
    case State::ReadingHeader: return &Pipe::read_header_part;
    case State::ReadingBody:   return &Pipe::read_body_part;
    case State::Eof:           return &Pipe::read_eof;
    case State::NotReady:      break;
    }
    return nullptr;
}

bool Pipe::read(Event& ev, Error& err) {
    if (!_sock) { err.set(Errc::NotInitialized, ""); return false; }
    if (_state == State::NotReady) { err.set(Errc::NotReady, ""); return false; }

    if (_read_timeout_ms > 0) _sock->set_timeout(_read_timeout_ms);

    const Handler h = handler_for(_state);
    if (!h) {
        throw std::logic_error("bad state: " + std::to_string(static_cast<int>(_state)));
    }
    ev = Event{};
    return (this->*h)(ev, err);
}

bool Pipe::discard_line(Error& err) {
    std::string line;
    return _read_line(line, err);
}

// Trailer fields after the last chunk are skipped up to the blank line.
bool Pipe::skip_trailer(Error& err) {
    std::string line;
    do {
        if (!_read_line(line, err)) return false;
    } while (!line.empty());
    return true;
}

bool Pipe::read_statusline(Event& ev, Error& err) {
    if (!_read_line) {
        _read_line = _sock->receive_until("\r\n");
    }

    std::string line;
    if (!_read_line(line, err)) {
        err.message = "read status line failed: " + err.message;
        return false;
    }

    internal::StatusLine sl;
    if (!internal::parse_status_line(line, sl)) {
        err.set(Errc::MalformedStatusLine, line);
        return false;
    }

    if (sl.code == 100) {
        // Interim response: drop its blank line, the real status line follows.
        if (!discard_line(err)) return false;
        _state = State::Begin;
    } else {
        if (sl.major < 1 || (sl.major == 1 && sl.minor == 0)) {
            _keepalive = false;  // HTTP/1.0 needs an explicit keep-alive
        }
        _state = State::ReadingHeader;
    }

    ev.type = EventType::StatusLine;
    ev.status = sl.code;
    return true;
}

bool Pipe::read_header_part(Event& ev, Error& err) {
    std::string line;
    if (!_read_line(line, err)) return false;

    if (line.empty()) {
        _state = State::ReadingBody;
        ev.type = EventType::HeaderEnd;
        return true;
    }

    ev.type = EventType::Header;
    ev.header.raw = line;

    std::string name, value;
    if (!internal::split_header_line(line, name, value)) {
        ev.header.value = line;
        return true;
    }

    if (iequals(name, "Content-Length")) {
        std::uint64_t len = 0;
        if (internal::parse_decimal(value, len)) {
            _remaining = len;
        } else {
            log_line("[PIPE] ignoring bad Content-Length: " + value);
        }
    } else if (iequals(name, "Transfer-Encoding")) {
        if (!iequals(value, "identity")) _chunked = true;
    } else if (iequals(name, "Connection")) {
        if (iequals(value, "close")) _keepalive = false;
        else if (iequals(value, "keep-alive")) _keepalive = true;
    }

    ev.header.name = internal::normalize_header(name);
    ev.header.value = value;
    return true;
}

bool Pipe::read_body_part(Event& ev, Error& err) {
    if (_method == "HEAD") {
        _state = State::Eof;
        ev.type = EventType::BodyEnd;
        return true;
    }

    if (_chunked && _remaining == 0 && !_peer_closed) {
        std::string line;
        if (!_read_line(line, err)) return false;
        // CRLF closing the previous chunk
        if (line.empty() && !_read_line(line, err)) return false;

        std::uint64_t size = 0;
        if (!internal::parse_hex_size(line, size)) {
            err.set(Errc::BadChunkSize, line);
            return false;
        }
        if (size == 0) {
            if (!skip_trailer(err)) return false;
            _state = State::Eof;
            ev.type = EventType::BodyEnd;
            return true;
        }
        _remaining = size;
    }

    if (_remaining == 0) {
        _state = State::Eof;
        ev.type = EventType::BodyEnd;
        return true;
    }

    const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(_remaining, _size));
    std::string data;
    if (!_sock->receive(want, data, err)) {
        if (err.code != Errc::Closed) return false;

        _keepalive = false;
        _peer_closed = true;
        if (data.empty()) {
            err.clear();
            _state = State::Eof;
            ev.type = EventType::BodyEnd;
            return true;
        }
        if (data.size() < _remaining) {
            const std::uint64_t missing = _remaining - data.size();
            _state = State::Eof;
            err.set(Errc::PrematureClose,
                    "connection closed with " + std::to_string(missing) + " body bytes missing");
            log_line("[PIPE] " + err.message);
            return false;
        }
        // The peer closed right after the last byte.
        err.clear();
    }

    _remaining -= data.size();
    ev.type = EventType::Body;
    ev.data = std::move(data);
    return true;
}

bool Pipe::read_eof(Event& ev, Error& err) {
    if (!finalize(_ka, err)) return false;
    ev.type = EventType::Eof;
    return true;
}

bool Pipe::read_body(std::string& chunk, bool& done, Error& err) {
    if (!_sock) { err.set(Errc::NotInitialized, ""); return false; }
    if (static_cast<int>(_state) < static_cast<int>(State::ReadingBody)) {
        err.set(Errc::NotReady, "not ready for reading body");
        return false;
    }

    chunk.clear();
    done = false;

    Event ev;
    if (!read(ev, err)) return false;

    if (ev.type == EventType::Body) {
        chunk = std::move(ev.data);
        return true;
    }
    if (ev.type == EventType::BodyEnd) {
        if (!finalize(_ka, err)) return false;
    }
    done = true;
    return true;
}

// --- connection lifecycle ---

bool Pipe::finalize(const KeepaliveOptions& ka, Error& err) {
    if (!_sock) { err.set(Errc::NotInitialized, ""); return false; }

    _eof = true;
    if (_released) return true;
    _released = true;

    // A connection is only reusable once its response was fully read.
    if (_keepalive && _state == State::Eof) {
        return _sock->set_keepalive(ka, err);
    }
    return _sock->close(err);
}

bool Pipe::set_keepalive(Error& err) {
    return finalize(_ka, err);
}

bool Pipe::set_keepalive(const KeepaliveOptions& ka, Error& err) {
    return finalize(ka, err);
}

bool Pipe::close(Error& err) {
    if (!_sock) { err.set(Errc::NotInitialized, ""); return false; }

    _eof = true;
    if (_released) return true;
    _released = true;
    return _sock->close(err);
}

bool Pipe::get_reused_times(int& times, Error& err) const {
    if (!_sock) { err.set(Errc::NotInitialized, ""); return false; }
    return _sock->get_reused_times(times, err);
}

} // namespace hp
