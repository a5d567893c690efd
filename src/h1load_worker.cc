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
#include "h1load_worker.h"

#include <cassert>
#include <algorithm>

#include "h1load_target.h"
#include "h1load_log.h"
#include "util.h"
#include "template.h"

namespace h1load {

namespace {
// Upper bound of sleep between open-loop dispatch checks
constexpr double DISPATCH_TICK = 1_ms;
} // namespace

ConcurrencyGate::ConcurrencyGate(size_t capacity)
    : capacity_(capacity), in_use_(0), peak_(0) {}

bool ConcurrencyGate::try_acquire() {
  if (in_use_ >= capacity_) {
    return false;
  }
  ++in_use_;
  peak_ = std::max(peak_, in_use_);
  return true;
}

void ConcurrencyGate::release() {
  assert(in_use_ > 0);
  --in_use_;
}

size_t ConcurrencyGate::in_use() const { return in_use_; }

size_t ConcurrencyGate::capacity() const { return capacity_; }

size_t ConcurrencyGate::peak() const { return peak_; }

Stats::Stats()
    : req_todo(0), req_success(0), req_failed(0), req_connect_failed(0),
      req_timedout(0), bytes_total(0) {}

namespace {
void dispatch_timeout_cb(struct ev_loop *loop, ev_timer *w, int revents) {
  auto worker = static_cast<Worker *>(w->data);
  worker->schedule();
}
} // namespace

Worker::Worker(uint32_t id, const Target *target, const addrinfo *addrs,
               size_t concurrency, ev_tstamp timeout)
    : gate(concurrency), loop(ev_loop_new(0)), target(target), addrs(addrs),
      timeout(timeout), interval(0), duration(0), next_dispatch(0),
      max_outstanding(0), nqueued(0), noutstanding(0), peak_outstanding(0),
      id(id), dispatching(false) {
  ev_timer_init(&dispatch_watcher, dispatch_timeout_cb, 0., 0.);
  dispatch_watcher.data = this;
}

Worker::~Worker() {
  ev_timer_stop(loop, &dispatch_watcher);
  // first clear clients so that io watchers are stopped before
  // destructing ev_loop.
  clients.clear();
  ev_loop_destroy(loop);
}

void Worker::run_closed(size_t nreqs) {
  start_time = std::chrono::steady_clock::now();

  for (size_t i = 0; i < nreqs; ++i) {
    submit();
  }

  ev_run(loop, 0);

  end_time = std::chrono::steady_clock::now();
}

void Worker::run_open(double rate, double duration) {
  this->interval = 1. / std::max(rate, 1e-9);
  this->duration = duration;
  next_dispatch = 0;
  max_outstanding = OPEN_LOOP_OUTSTANDING_FACTOR * gate.capacity();

  start_time = std::chrono::steady_clock::now();

  schedule();

  ev_run(loop, 0);

  end_time = std::chrono::steady_clock::now();
}

void Worker::submit() {
  ++stats.req_todo;
  ++nqueued;
  ++noutstanding;
  peak_outstanding = std::max(peak_outstanding, noutstanding);

  dispatch_pending();
}

void Worker::dispatch_pending() {
  // Client may finish synchronously and call this function again
  // through on_request_done().  The outer loop picks up the freed
  // slot.
  if (dispatching) {
    return;
  }

  dispatching = true;

  while (nqueued > 0 && gate.try_acquire()) {
    --nqueued;

    auto client_store = make_unique<Client>(this);
    auto client = client_store.get();
    clients.emplace(client, std::move(client_store));

    if (client->start() != 0) {
      client->fail();
    }
  }

  dispatching = false;
}

void Worker::schedule() {
  for (;;) {
    auto elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start_time)
                       .count();

    if (elapsed >= duration) {
      // Stop dispatching.  ev_run() returns when all outstanding
      // requests finish.
      ev_timer_stop(loop, &dispatch_watcher);
      return;
    }

    if (elapsed >= next_dispatch && noutstanding < max_outstanding) {
      submit();
      next_dispatch += interval;
      continue;
    }

    auto wait = DISPATCH_TICK;
    if (elapsed < next_dispatch) {
      wait = std::min(wait, next_dispatch - elapsed);
    }

    ev_now_update(loop);
    dispatch_watcher.repeat = wait;
    ev_timer_again(loop, &dispatch_watcher);

    return;
  }
}

void Worker::on_request_done(Client *client, const RequestOutcome &outcome) {
  stats.bytes_total += client->bytes_read;

  if (outcome.success()) {
    ++stats.req_success;
    stats.latencies.push_back(outcome.latency);
  } else {
    ++stats.req_failed;

    switch (outcome.failure) {
    case FAILURE_CONNECT:
      ++stats.req_connect_failed;
      break;
    case FAILURE_TIMEOUT:
      ++stats.req_timedout;
      break;
    default:
      break;
    }

    if (LOG_ENABLED(INFO)) {
      WLOG(INFO, id) << "request failed: "
                     << (outcome.failure == FAILURE_CONNECT
                             ? "connect"
                             : outcome.failure == FAILURE_TIMEOUT ? "timeout"
                                                                  : "I/O")
                     << " error, " << client->bytes_read << " bytes read";
    }
  }

  clients.erase(client);

  gate.release();
  --noutstanding;

  dispatch_pending();
}

RunSummary Worker::get_summary() const {
  RunSummary res;

  res.req_success = stats.req_success;
  res.req_failed = stats.req_failed;
  res.req_connect_failed = stats.req_connect_failed;
  res.req_timedout = stats.req_timedout;
  res.duration = std::chrono::duration_cast<std::chrono::microseconds>(
      end_time - start_time);
  res.latency = compute_latency_stat(stats.latencies);
  res.rps = compute_rps(res.req_success, res.duration);
  res.peak_outstanding = peak_outstanding;
  res.peak_executing = gate.peak();

  return res;
}

} // namespace h1load
