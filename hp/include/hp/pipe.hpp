/*
 * Part of the HTTPipe (HP) project.
 *
 * SPDX-FileCopyrightText: 2025 HTTPipe contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HTTPipe (HP). See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>
#include "hp/types.hpp"
#include "hp/error.hpp"
#include "hp/header_map.hpp"
#include "hp/http_response.hpp"
#include "hp/request_options.hpp"
#include "hp/transport.hpp"

namespace hp {

struct HeaderLine {
    std::string name;   // canonical name; empty when the line had no colon
    std::string value;  // the raw line when name is empty
    std::string raw;
};

// One step of the response parser. Only the member matching `type` is set.
struct Event {
    EventType   type = EventType::Eof;
    int         status = 0;   // StatusLine
    HeaderLine  header;       // Header
    std::string data;         // Body
};

// Early-exit hooks for Pipe::response(). Returning true stops the drain loop.
struct ResponseFilters {
    std::function<bool(int status, const HeaderMap& headers)> header_filter;
    std::function<bool(const std::string& chunk)> body_filter;
};

// HTTP/1.x request/response cycle over one transport connection.
// Not thread-safe: one caller drives a pipe at a time.
class Pipe {
public:
    // Owns a TcpTransport.
    explicit Pipe(std::size_t chunk_size = kDefaultChunkSize);
    // Uses `transport`; a null transport leaves the pipe unbound and every
    // operation fails with Errc::NotInitialized.
    explicit Pipe(std::unique_ptr<Transport> transport,
                  std::size_t chunk_size = kDefaultChunkSize);
    ~Pipe();

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool set_timeout(int ms, Error& err);

    // Connect, send the request and (unless opts.stream == Full) read the
    // response into `out`.
    //   target: {"host"} | {"host", "port"} | {"unix:/path"}
    bool request(const std::vector<std::string>& target, const RequestOptions& opts,
                 HttpResponse& out, Error& err);
    bool request(const std::string& host, std::uint16_t port, const RequestOptions& opts,
                 HttpResponse& out, Error& err);
    bool request(const Endpoint& ep, const RequestOptions& opts,
                 HttpResponse& out, Error& err);

    // Drain events until eof or until a filter asks to stop.
    bool response(HttpResponse& out, Error& err);
    bool response(const ResponseFilters& filters, HttpResponse& out, Error& err);

    // Next parser event. Fails with Errc::NotReady before a request was sent.
    bool read(Event& ev, Error& err);

    // Next body chunk. `done` turns true when the body is complete; the
    // connection has been finalized by then.
    bool read_body(std::string& chunk, bool& done, Error& err);

    // Finalize: pool the connection when keepalive still holds, else close.
    bool set_keepalive(Error& err);
    bool set_keepalive(const KeepaliveOptions& ka, Error& err);
    bool close(Error& err);
    bool get_reused_times(int& times, Error& err) const;

    State state() const { return _state; }
    bool eof() const { return _eof; }
    bool keepalive() const { return _keepalive; }
    bool chunked() const { return _chunked; }
    std::uint64_t remaining() const { return _remaining; }
    const std::string& method() const { return _method; }

private:
    using Handler = bool (Pipe::*)(Event&, Error&);
    static Handler handler_for(State s);

    bool read_statusline(Event& ev, Error& err);
    bool read_header_part(Event& ev, Error& err);
    bool read_body_part(Event& ev, Error& err);
    bool read_eof(Event& ev, Error& err);

    bool discard_line(Error& err);
    bool skip_trailer(Error& err);
    bool finalize(const KeepaliveOptions& ka, Error& err);
    bool send_body(const RequestOptions& opts, const HeaderMap& headers, Error& err);
    void reset_cycle();

    std::unique_ptr<Transport> _sock;
    std::size_t   _size;
    State         _state = State::NotReady;
    LineReader    _read_line;
    int           _read_timeout_ms = 0;
    std::uint64_t _remaining = 0;
    bool          _chunked = false;
    bool          _keepalive = true;
    bool          _peer_closed = false;
    bool          _released = false;   // transport handed back once this cycle
    std::string   _method;
    bool          _eof = false;
    KeepaliveOptions _ka;
};

} // namespace hp
