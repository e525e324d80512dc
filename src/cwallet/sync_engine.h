// Copyright (c) 2021, The Monero Project
//
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

// NOT FOR PRODUCTION

// Background ledger sync: a coordinator thread hands out account sync tasks to a pool of workers.
// - each account is synced by at most one worker at a time (its task carries the account's claim)
// - a task whose chunk was exhausted goes back to the end of the queue with its claim
// - stopping takes effect between tasks (a chunk in progress runs to completion)


#pragma once

//local headers
#include "cwallet_core/cwallet_config.h"
#include "in_flight_accounts.h"

//third party headers
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include <boost/variant/variant.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

//forward declarations
namespace cw
{
    class LedgerContext;
    class WalletStore;
}

namespace cw
{

struct SyncEngineConfig final
{
    /// number of worker threads (0: hardware concurrency)
    std::size_t m_num_workers{0};
    /// max number of blocks a worker scans for an account before requeueing it
    std::uint64_t m_blocks_per_chunk{config::CW_SYNC_BLOCKS_PER_CHUNK};
    /// how long the coordinator sleeps when no account needs syncing
    std::uint64_t m_poll_interval_ms{config::CW_SYNC_POLL_INTERVAL_MS};
};

////
// SyncAccountTask
// - sync a chunk of blocks for the claimed account
///
struct SyncAccountTask final
{
    AccountClaim m_claim;
};

////
// StopTask
// - the worker that pops it exits
///
struct StopTask final
{};

using SyncTask = boost::variant<SyncAccountTask, StopTask>;

////
// SyncTaskQueue
// - multi-producer multi-consumer FIFO
// - holds at most one sync task per account (tasks own claims) plus one stop task per worker
///
class SyncTaskQueue final
{
public:
//member functions
    void push(SyncTask task);
    /// wait for a task
    SyncTask pop();
    /// drop all queued tasks
    void clear();
    std::size_t size() const;

private:
    mutable boost::mutex m_mutex;
    boost::condition_variable m_condition;
    std::deque<SyncTask> m_tasks;
};

////
// SyncEngine
///
class SyncEngine final
{
public:
//constructors
    SyncEngine(WalletStore &store, const LedgerContext &ledger, const SyncEngineConfig &config);
    SyncEngine(const SyncEngine&) = delete;

//destructor
    /// stops the threads if they are running
    ~SyncEngine();

//overloaded operators
    SyncEngine& operator=(const SyncEngine&) = delete;

//member functions
    /// launch the coordinator and workers
    void start();
    /// signal the coordinator and workers to stop, then join them (queued tasks are dropped)
    void stop();
    bool is_running() const;
    /// wake the coordinator before its poll interval elapses (e.g. after a new block or a new account)
    void notify();
    /**
    * brief: enqueue_ready_accounts - claim and enqueue every account that is behind the ledger tip
    * return: number of tasks enqueued
    */
    std::size_t enqueue_ready_accounts();
    /// number of accounts currently claimed by queued or running tasks
    std::size_t num_accounts_in_flight() const { return m_in_flight_accounts.num_claimed(); }

private:
    void coordinator_loop();
    void worker_loop(const std::size_t worker_index);

//member variables
    WalletStore &m_store;
    const LedgerContext &m_ledger;
    const SyncEngineConfig m_config;

    InFlightAccounts m_in_flight_accounts;
    SyncTaskQueue m_task_queue;

    /// stop/wake signalling for the coordinator
    mutable boost::mutex m_state_mutex;
    boost::condition_variable m_state_condition;
    bool m_running{false};
    bool m_stop_requested{false};
    bool m_wake_requested{false};

    boost::thread m_coordinator;
    std::vector<boost::thread> m_workers;
};

} //namespace cw
