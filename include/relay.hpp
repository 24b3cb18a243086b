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
 * @file relay.hpp
 * @brief Relay - framed TCP message relay with rooms
 *
 * Length-prefixed binary frames over TCP, a function-pointer connection
 * state machine, named rooms with snapshot broadcast, and a poll() reactor.
 *
 * Usage:
 *   #include "relay.hpp"
 *
 *   int main() {
 *     relay::ServerConfig cfg;
 *     cfg.port = 4000;
 *     relay::Server server(cfg);
 *     server.run();
 *   }
 */

#ifndef RELAY_HPP_
#define RELAY_HPP_

#include "relay/buffer.hpp"
#include "relay/config.hpp"
#include "relay/connection.hpp"
#include "relay/connection_registry.hpp"
#include "relay/connection_state.hpp"
#include "relay/dispatcher.hpp"
#include "relay/frame.hpp"
#include "relay/handlers.hpp"
#include "relay/log.hpp"
#include "relay/message_sink.hpp"
#include "relay/room.hpp"
#include "relay/room_registry.hpp"
#include "relay/server.hpp"
#include "relay/stats.hpp"
#include "relay/vocabulary.hpp"

#endif  // RELAY_HPP_
