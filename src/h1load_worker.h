/*
 * h1load - HTTP/1.1 load generator
 *
 * Copyright (c) 2015 Tatsuhiro Tsujikawa
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */
#ifndef H1LOAD_WORKER_H
#define H1LOAD_WORKER_H

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#include <cstdint>
#include <chrono>
#include <memory>
#include <unordered_map>
#include <vector>

#include <ev.h>

#include "h1load_client.h"
#include "h1load_stats.h"

namespace h1load {

struct Target;

// In open-loop mode, the number of dispatched but not yet completed
// requests is limited to this factor times the concurrency cap.
constexpr size_t OPEN_LOOP_OUTSTANDING_FACTOR = 4;

// Counting admission gate limiting the number of requests executing
// at once.
class ConcurrencyGate {
public:
  explicit ConcurrencyGate(size_t capacity);
  // Takes one slot and returns true if a slot is available.
  // Otherwise returns false.
  bool try_acquire();
  void release();
  size_t in_use() const;
  size_t capacity() const;
  // The maximum value of in_use() observed so far.
  size_t peak() const;

private:
  size_t capacity_;
  size_t in_use_;
  size_t peak_;
};

struct Stats {
  Stats();
  // The number of requests dispatched
  size_t req_todo;
  // The number of requests completed successfully.
  size_t req_success;
  // The number of requests failed.  This is subset of req_todo.
  size_t req_failed;
  // The number of requests failed because connection could not be
  // made.  This is subset of req_failed.
  size_t req_connect_failed;
  // The number of requests that failed due to timeout.  This is
  // subset of req_failed.
  size_t req_timedout;
  // The number of bytes received
  int64_t bytes_total;
  // latency of each successful request
  std::vector<std::chrono::nanoseconds> latencies;
};

// Worker executes one run on its own event loop.  Requests are
// dispatched either all at once (closed-loop), or at fixed rate
// (open-loop).  Dispatched requests wait for a slot of the
// ConcurrencyGate before they connect.
struct Worker {
  std::unordered_map<Client *, std::unique_ptr<Client>> clients;
  Stats stats;
  ConcurrencyGate gate;
  struct ev_loop *loop;
  const Target *target;
  const addrinfo *addrs;
  // timeout applied to connect, write, and each read
  ev_tstamp timeout;
  std::chrono::steady_clock::time_point start_time, end_time;
  // Called on open-loop dispatch schedule
  ev_timer dispatch_watcher;
  // open-loop: interval between dispatches in seconds
  double interval;
  // open-loop: dispatch stops after this many seconds
  double duration;
  // open-loop: the next dispatch time, in seconds since start_time
  double next_dispatch;
  // The maximum number of outstanding requests allowed
  size_t max_outstanding;
  // The number of dispatched requests waiting for a gate slot
  size_t nqueued;
  // The number of dispatched requests not yet completed, including
  // nqueued.
  size_t noutstanding;
  size_t peak_outstanding;
  uint32_t id;
  // true while dispatch_pending() is running
  bool dispatching;

  Worker(uint32_t id, const Target *target, const addrinfo *addrs,
         size_t concurrency, ev_tstamp timeout);
  ~Worker();
  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  // Issues exactly |nreqs| requests and returns after all of them
  // finished.
  void run_closed(size_t nreqs);
  // Dispatches requests at |rate| requests per second for |duration|
  // seconds, and returns after all dispatched requests finished.
  void run_open(double rate, double duration);

  // Accepts one request for execution.
  void submit();
  // Starts queued requests while gate slots are available.
  void dispatch_pending();
  // Dispatches requests which are due, and arms dispatch_watcher
  // for the next one.
  void schedule();
  void on_request_done(Client *client, const RequestOutcome &outcome);

  RunSummary get_summary() const;
};

} // namespace h1load

#endif // H1LOAD_WORKER_H
