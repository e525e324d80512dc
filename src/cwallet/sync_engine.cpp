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

//paired header
#include "sync_engine.h"

//local headers
#include "account_sync.h"
#include "cwallet_core/ledger_context.h"
#include "in_flight_accounts.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "wallet_store.h"
#include "wallet_store_types.h"

//third party headers
#include <boost/chrono/duration.hpp>
#include <boost/optional/optional.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include <boost/variant/get.hpp>

//standard headers
#include <algorithm>
#include <deque>
#include <exception>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.sync"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
void SyncTaskQueue::push(SyncTask task)
{
    {
        boost::lock_guard<boost::mutex> lock{m_mutex};
        m_tasks.emplace_back(std::move(task));
    }
    m_condition.notify_one();
}
//-------------------------------------------------------------------------------------------------------------------
SyncTask SyncTaskQueue::pop()
{
    boost::unique_lock<boost::mutex> lock{m_mutex};
    m_condition.wait(lock, [this]() -> bool { return !m_tasks.empty(); });

    SyncTask task{std::move(m_tasks.front())};
    m_tasks.pop_front();
    return task;
}
//-------------------------------------------------------------------------------------------------------------------
void SyncTaskQueue::clear()
{
    // destroy the tasks outside the lock (dropping a sync task releases its claim)
    std::deque<SyncTask> dropped_tasks;
    {
        boost::lock_guard<boost::mutex> lock{m_mutex};
        dropped_tasks.swap(m_tasks);
    }
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t SyncTaskQueue::size() const
{
    boost::lock_guard<boost::mutex> lock{m_mutex};
    return m_tasks.size();
}
//-------------------------------------------------------------------------------------------------------------------
SyncEngine::SyncEngine(WalletStore &store, const LedgerContext &ledger, const SyncEngineConfig &config) :
    m_store{store},
    m_ledger{ledger},
    m_config{config}
{
    CHECK_AND_ASSERT_THROW_MES(m_config.m_blocks_per_chunk > 0,
        "sync engine: chunks must contain at least one block.");
}
//-------------------------------------------------------------------------------------------------------------------
SyncEngine::~SyncEngine()
{
    try
    {
        this->stop();
    }
    catch (const std::exception &e)
    {
        MERROR("Failed to stop the sync engine: " << e.what());
    }
}
//-------------------------------------------------------------------------------------------------------------------
void SyncEngine::start()
{
    boost::lock_guard<boost::mutex> lock{m_state_mutex};
    CHECK_AND_ASSERT_THROW_MES(!m_running, "sync engine: already running.");

    m_stop_requested = false;
    m_wake_requested = false;

    const std::size_t num_workers{
            m_config.m_num_workers > 0
            ? m_config.m_num_workers
            : std::max<std::size_t>(1, boost::thread::hardware_concurrency())
        };

    MINFO("Starting the sync engine with " << num_workers << " worker(s).");

    m_workers.reserve(num_workers);
    for (std::size_t worker_index{0}; worker_index < num_workers; ++worker_index)
        m_workers.emplace_back([this, worker_index]() { this->worker_loop(worker_index); });

    m_coordinator = boost::thread{[this]() { this->coordinator_loop(); }};
    m_running = true;
}
//-------------------------------------------------------------------------------------------------------------------
void SyncEngine::stop()
{
    // 1. stop the coordinator (no more tasks are produced after it exits)
    {
        boost::lock_guard<boost::mutex> lock{m_state_mutex};
        if (!m_running)
            return;

        m_stop_requested = true;
    }
    m_state_condition.notify_all();

    if (m_coordinator.joinable())
        m_coordinator.join();

    // 2. stop the workers
    // - stop tasks go behind all queued sync tasks, and requeued sync tasks go behind the stop tasks,
    //   so each worker pops exactly one stop task
    for (std::size_t worker_index{0}; worker_index < m_workers.size(); ++worker_index)
        m_task_queue.push(StopTask{});

    for (boost::thread &worker : m_workers)
    {
        if (worker.joinable())
            worker.join();
    }
    m_workers.clear();

    // 3. drop leftover tasks (releases their claims)
    m_task_queue.clear();

    {
        boost::lock_guard<boost::mutex> lock{m_state_mutex};
        m_running = false;
    }

    MINFO("Stopped the sync engine.");
}
//-------------------------------------------------------------------------------------------------------------------
bool SyncEngine::is_running() const
{
    boost::lock_guard<boost::mutex> lock{m_state_mutex};
    return m_running;
}
//-------------------------------------------------------------------------------------------------------------------
void SyncEngine::notify()
{
    {
        boost::lock_guard<boost::mutex> lock{m_state_mutex};
        m_wake_requested = true;
    }
    m_state_condition.notify_all();
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t SyncEngine::enqueue_ready_accounts()
{
    const std::uint64_t num_blocks{m_ledger.num_blocks()};
    std::size_t num_enqueued{0};

    Account account;
    for (const rct::key &account_id : m_store.get_account_ids())
    {
        if (!m_store.try_get_account(account_id, account) || account.m_next_block_index >= num_blocks)
            continue;

        boost::optional<AccountClaim> claim{m_in_flight_accounts.try_claim(account_id)};
        if (!claim)
            continue;

        m_task_queue.push(SyncAccountTask{std::move(*claim)});
        ++num_enqueued;
    }

    return num_enqueued;
}
//-------------------------------------------------------------------------------------------------------------------
void SyncEngine::coordinator_loop()
{
    while (true)
    {
        std::size_t num_enqueued{0};
        try
        {
            num_enqueued = this->enqueue_ready_accounts();
        }
        catch (const std::exception &e)
        {
            MERROR("Sync coordinator failed to enqueue accounts: " << e.what());
        }

        boost::unique_lock<boost::mutex> lock{m_state_mutex};
        if (m_stop_requested)
            return;

        if (num_enqueued == 0)
        {
            m_state_condition.wait_for(lock,
                boost::chrono::milliseconds{m_config.m_poll_interval_ms},
                [this]() -> bool { return m_stop_requested || m_wake_requested; });
        }

        if (m_stop_requested)
            return;
        m_wake_requested = false;
    }
}
//-------------------------------------------------------------------------------------------------------------------
void SyncEngine::worker_loop(const std::size_t worker_index)
{
    MDEBUG("Sync worker " << worker_index << " started.");

    while (true)
    {
        SyncTask task{m_task_queue.pop()};

        SyncAccountTask *sync_task{boost::get<SyncAccountTask>(&task)};
        if (sync_task == nullptr)
            break;

        // the claim is released when it goes out of scope unless the task is requeued
        AccountClaim claim{std::move(sync_task->m_claim)};
        AccountSyncResult result{AccountSyncResult::NO_MORE_BLOCKS};

        try
        {
            result = sync_account_chunk(m_store, m_ledger, claim.account_id(), m_config.m_blocks_per_chunk);
        }
        catch (const std::exception &e)
        {
            MERROR("Sync worker " << worker_index << " abandoned a chunk of account " << claim.account_id()
                << ": " << e.what());
            continue;
        }

        if (result == AccountSyncResult::MORE_BLOCKS_POTENTIALLY_AVAILABLE)
        {
            MDEBUG("Requeueing account " << claim.account_id() << " (more blocks may be available).");
            m_task_queue.push(SyncAccountTask{std::move(claim)});
        }
        else
            MDEBUG("Account " << claim.account_id() << " is caught up.");
    }

    MDEBUG("Sync worker " << worker_index << " stopped.");
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
