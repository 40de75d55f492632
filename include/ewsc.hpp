/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file ewsc.hpp
 * @brief EWSC - Embedded WebSocket Client (connection establishment)
 *
 * Opens a WebSocket connection for embedded Linux (ARM/x86):
 * URL normalization, endpoint resolution, non-blocking TCP or Unix socket
 * dial, optional mbedTLS channel, RFC 6455 opening handshake.
 * Every stage reports failure through ewsc::expected; nothing throws.
 *
 * Usage:
 *   #include "ewsc.hpp"
 *
 *   int main() {
 *     auto result = ewsc::connect("ws://127.0.0.1:8080/chat");
 *     if (!result) {
 *       std::cerr << ewsc::to_string(result.get_error()) << "\n";
 *       return 1;
 *     }
 *     auto& conn = result.value();
 *     conn.stream.send_text("hello");
 *   }
 *
 * @see RFC 6455: The WebSocket Protocol
 */

#ifndef EWSC_HPP_
#define EWSC_HPP_

#include "ewsc/vocabulary.hpp"
#include "ewsc/log.hpp"
#include "ewsc/utils.hpp"
#include "ewsc/request.hpp"
#include "ewsc/endpoint.hpp"
#include "ewsc/channel.hpp"
#include "ewsc/dialer.hpp"
#include "ewsc/tls.hpp"
#include "ewsc/handshake.hpp"
#include "ewsc/websocket_stream.hpp"
#include "ewsc/upgrader.hpp"
#include "ewsc/connect.hpp"

#endif  // EWSC_HPP_
