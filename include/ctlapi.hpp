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
 * @file ctlapi.hpp
 * @brief ctlapi - local control-socket API server for machine-control hosts
 *
 * Serves JSON requests framed by a 0x03 terminator over a Unix socket,
 * dispatches them to registered endpoints on the host's event loop, and
 * pushes subscribed object status to clients every 250 ms.
 *
 * Usage:
 *   #include "ctlapi.hpp"
 *
 *   int main() {
 *     ctlapi::Reactor reactor;
 *     ctlapi::ServerConfig config("/tmp/ctlapi.sock");
 *     ctlapi::Router router(host, start_args);
 *     ctlapi::SubscriptionEngine status(reactor, registry, router);
 *     ctlapi::Listener listener(reactor, config, router);
 *     listener.open();
 *     status.handle_ready();
 *     reactor.run();
 *   }
 */

#ifndef CTLAPI_HPP_
#define CTLAPI_HPP_

#include "ctlapi/config.hpp"
#include "ctlapi/connection.hpp"
#include "ctlapi/event_loop.hpp"
#include "ctlapi/frame_codec.hpp"
#include "ctlapi/host.hpp"
#include "ctlapi/listener.hpp"
#include "ctlapi/log.hpp"
#include "ctlapi/output_broadcaster.hpp"
#include "ctlapi/reactor.hpp"
#include "ctlapi/request.hpp"
#include "ctlapi/router.hpp"
#include "ctlapi/subscription.hpp"
#include "ctlapi/vocabulary.hpp"

#endif  // CTLAPI_HPP_
