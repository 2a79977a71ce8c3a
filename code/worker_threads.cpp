#include "worker_threads.hpp"

#include <exception>
#include <functional>
#include <iostream>
#include <latch>
#include <list>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "dispatch_logic.h"


namespace {

    DispatchFunction default_dispatch_function() {
        return [](const dispatch::DispatchRequest& request) { return dispatch::run_dispatch(request); };
    }

    void solve_entry(const DispatchFunction& dispatch_function, const dispatch::DispatchRequest& request, BatchEntry& entry) {
        // all exceptions are stored, the worker must always reach the latch
        try {
            entry.outcome = dispatch_function(request);
        } catch (...) {
            entry.error = std::current_exception();
        }
    }

}


// ----------------------------------- //
//         Implementation of           //
//     DispatchThreadGroupManager      //
// ----------------------------------- //

DispatchThreadGroupManager::DispatchThreadGroupManager(unsigned int n_threads, DispatchFunction dispatch_function_)
    : dispatch_function(dispatch_function_ ? std::move(dispatch_function_) : default_dispatch_function())
{
    if (n_threads < 1)
        throw std::logic_error("Thread group manager cannot be started if the number of worker threads is set to 0.");

    all_workers_finished_latch = NULL;
    current_requests = NULL;

    // Initialize the worker threads
    worker_threads.reserve( n_threads );
    for (unsigned int t = 0; t < n_threads; t++) {
        worker_threads.push_back( new DispatchWorkerThread( *this ) );
    }
}

DispatchThreadGroupManager::~DispatchThreadGroupManager() {
    for (DispatchWorkerThread* thread : worker_threads) {
        thread->stop();
        delete thread;
    }
    worker_threads.clear();
    delete all_workers_finished_latch;
}

void DispatchThreadGroupManager::startAllWorkerThreads() {
    for (DispatchWorkerThread* wt : worker_threads) {
        wt->start();
    }
}

void DispatchThreadGroupManager::stopAllWorkerThreads() {
    for (DispatchWorkerThread* wt : worker_threads) {
        wt->stop();
    }
}

void DispatchThreadGroupManager::executeBatch(const std::vector<dispatch::DispatchRequest>& requests) {
    current_requests = &requests;
    results.clear();
    results.resize(requests.size());
    // create as much lists as we have workers where we iteratively add one request
    std::vector<std::list<std::size_t>> vlr(worker_threads.size());
    unsigned int t = 0; // the current worker where the next request will be attached to
    for (std::size_t idx = 0; idx < requests.size(); idx++) {
        vlr[t].push_back(idx);
        t++;
        if ( t >= worker_threads.size() )
            t = 0;
    }
    // (Re-)Initialize the latch object
    if (all_workers_finished_latch != NULL)
        delete all_workers_finished_latch;
    all_workers_finished_latch = new std::latch( (std::ptrdiff_t) worker_threads.size() );
    // Notify all threads to start working
    for (std::size_t w = 0; w < worker_threads.size(); w++) {
        worker_threads[w]->executeAssignedRequests(vlr[w]);
    }
}

std::vector<BatchEntry> DispatchThreadGroupManager::waitForWorkersToFinish() {
    if (all_workers_finished_latch == NULL)
        throw std::logic_error("DispatchThreadGroupManager::waitForWorkersToFinish() called before executeBatch().");
    all_workers_finished_latch->wait();
    current_requests = NULL;
    return std::move(results);
}



// ----------------------------- //
//      Implementation of        //
//     DispatchWorkerThread      //
// ----------------------------- //
DispatchWorkerThread::DispatchWorkerThread(
    DispatchThreadGroupManager& caller
) : thread_group_manager(caller)
{
    atomic_flag_stop    = false;
    atomic_flag_exec    = false;
    atomic_flag_running = false;
}

DispatchWorkerThread::~DispatchWorkerThread() {
    // Stop the thread and clean up
    stop();
    // Join the threads and set the falgs to false
    if (current_thread.joinable()) {
        current_thread.join();
    }
    {
        std::unique_lock<std::mutex> lock_obj(mtx);
        atomic_flag_running = false;
    }
}

void DispatchWorkerThread::start() {
    // Is the thread already started?
    bool start_thread = false;
    {
        std::unique_lock<std::mutex> lock_obj(mtx);
        if (!atomic_flag_running) {
            start_thread = true;
            atomic_flag_running = true;
        }
    }
    // Start the thread, if it is not already running
    if (start_thread) {
        current_thread = std::thread(&DispatchWorkerThread::run, this);
    }
}

void DispatchWorkerThread::stop() {
    {
        std::unique_lock<std::mutex> lock_obj(mtx);
        atomic_flag_stop = true;
    }
    cv.notify_all();
}

void DispatchWorkerThread::executeAssignedRequests(const std::list<std::size_t>& request_indices)
{
    {
        std::unique_lock<std::mutex> lock_obj(mtx);
        assigned_requests  = request_indices;
        atomic_flag_exec   = true;
    }
    cv.notify_all();
}

void DispatchWorkerThread::run() {
    std::list<std::size_t> local_requests; // local copy of the assigned request indices
    while (true)
    {
        {
            // lock the mutex
            std::unique_lock<std::mutex> lock_obj(mtx);
            // wait for the variables to change (the wait-method releases the mutex until the condition is met)
            cv.wait(lock_obj, [this] { return atomic_flag_stop || atomic_flag_exec; });

            // return if stop flag has been set
            if (atomic_flag_stop && !atomic_flag_exec) {
                atomic_flag_stop = false;
                return;
            }
            atomic_flag_exec = false;
            local_requests.swap(assigned_requests);
            assigned_requests.clear();
        }
        // solve all assigned requests outside of the locked mutex
        const std::vector<dispatch::DispatchRequest>& requests = *(thread_group_manager.current_requests);
        for (std::size_t idx : local_requests) {
            solve_entry(thread_group_manager.dispatch_function, requests[idx], thread_group_manager.results[idx]);
        }
        local_requests.clear();
        thread_group_manager.all_workers_finished_latch->count_down();
    }
}



std::vector<BatchEntry> run_dispatch_batch(const std::vector<dispatch::DispatchRequest>& requests, unsigned int n_threads, DispatchFunction dispatch_function) {
    if (n_threads == 0) {
        const DispatchFunction func = dispatch_function ? dispatch_function : default_dispatch_function();
        std::vector<BatchEntry> results(requests.size());
        for (std::size_t idx = 0; idx < requests.size(); idx++)
            solve_entry(func, requests[idx], results[idx]);
        return results;
    }
    DispatchThreadGroupManager manager(n_threads, dispatch_function);
    manager.startAllWorkerThreads();
    manager.executeBatch(requests);
    std::vector<BatchEntry> results = manager.waitForWorkersToFinish();
    manager.stopAllWorkerThreads();
    return results;
}
