// Copyright 2012 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "engine/scheduler.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "engine/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"

namespace logging = utils::logging;


/// Internal implementation of the scheduler.
struct engine::scheduler::impl : utils::noncopyable {
    /// Evaluator shared by all workers.
    evaluator runner;

    /// Protects the fields below.
    std::mutex mutex;

    /// Signals the workers that there is work to do or that they must exit.
    std::condition_variable wakeup;

    /// Pending work, in submission order.
    std::deque< std::packaged_task< model::execution_result (void) > > queue;

    /// Whether cleanup() has been called.
    bool stopping;

    /// Worker threads.
    std::vector< std::thread > workers;

    /// Constructor.
    ///
    /// \param runner_ Evaluator shared by all workers.
    explicit impl(const evaluator& runner_) :
        runner(runner_),
        stopping(false)
    {
    }

    /// Body of a worker thread.
    ///
    /// Runs queued work until the scheduler is stopped and the queue is
    /// empty.
    ///
    /// \param id Number of the worker, used to tag its log entries.
    void
    work(const int id)
    {
        logging::set_thread_name(F("worker-%s") % id);
        for (;;) {
            std::packaged_task< model::execution_result (void) > task;
            {
                std::unique_lock< std::mutex > lock(mutex);
                while (queue.empty() && !stopping)
                    wakeup.wait(lock);
                if (queue.empty())
                    return;
                task = std::move(queue.front());
                queue.pop_front();
            }
            task();
        }
    }

    /// Stops the workers once the pending work is done.
    void
    join(void)
    {
        {
            std::lock_guard< std::mutex > lock(mutex);
            if (stopping && workers.empty())
                return;
            stopping = true;
        }
        wakeup.notify_all();
        for (std::vector< std::thread >::iterator iter = workers.begin();
             iter != workers.end(); ++iter)
            (*iter).join();
        workers.clear();
    }
};


/// Constructor.
///
/// \param runner Evaluator to run the requests with.
/// \param parallelism Number of requests that can run concurrently.
engine::scheduler::scheduler(const evaluator& runner, const int parallelism) :
    _pimpl(new impl(runner))
{
    PRE(parallelism > 0);
    LI(F("Starting scheduler with %s workers") % parallelism);
    for (int i = 0; i < parallelism; ++i)
        _pimpl->workers.push_back(std::thread(&impl::work, _pimpl.get(),
                                              i + 1));
}


/// Destructor.
///
/// Waits for the pending requests to finish but does not release the
/// resources of the backend; use cleanup() for that.
engine::scheduler::~scheduler(void)
{
    _pimpl->join();
}


/// Queues a request for evaluation.
///
/// \param request The request to evaluate.
///
/// \return A future that yields the result of the request.
///
/// \throw engine::error If the scheduler has already been cleaned up.
std::future< model::execution_result >
engine::scheduler::submit(const model::execution_request& request)
{
    std::packaged_task< model::execution_result (void) > task(
        std::bind(&evaluator::evaluate, &_pimpl->runner, request));
    std::future< model::execution_result > result = task.get_future();
    {
        std::lock_guard< std::mutex > lock(_pimpl->mutex);
        if (_pimpl->stopping)
            throw engine::error("Cannot submit requests after cleanup");
        _pimpl->queue.push_back(std::move(task));
    }
    _pimpl->wakeup.notify_one();
    return result;
}


/// Waits for all pending requests and releases the backend resources.
///
/// This operation is idempotent.  No requests can be submitted afterwards.
void
engine::scheduler::cleanup(void)
{
    _pimpl->join();
    _pimpl->runner.cleanup();
}
