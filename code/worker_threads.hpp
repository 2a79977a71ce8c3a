/*
 * worker_threads.hpp
 *
 * It contains the definition of classes required for
 * solving a batch of dispatch requests with worker threads.
 *
 */

#ifndef WORKER_THREADS_HPP
#define WORKER_THREADS_HPP

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <latch>
#include <list>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

// The following classes are defined in this header file:
class DispatchThreadGroupManager;
class DispatchWorkerThread;

#include "dispatch_logic.h"

/*!
 * Outcome of one request of a batch.
 * Either outcome or error is set.
 */
struct BatchEntry {
    std::optional<dispatch::DispatchOutcome> outcome;
    std::exception_ptr error; ///< Exception raised by the request (e.g. ConfigurationError), to be rethrown by the caller
};

/*!
 * Function solving one request, dispatch::run_dispatch() by default
 */
using DispatchFunction = std::function<dispatch::DispatchOutcome(const dispatch::DispatchRequest&)>;

/*!
 * This class represents one group of threads of the class DispatchWorkerThread.
 * It provides functionality for creating and managing all existing thread instances.
 * The requests of a batch are distributed round-robin over the workers.
 *
 * This class is not thread-safe.
 */
class DispatchThreadGroupManager {
    private:
        friend class DispatchWorkerThread;

    public:
        /*!
         * Initializes a new instance of the thread group manager with n_threads worker threads.
         * @param dispatch_function: Function called for every request, dispatch::run_dispatch() if empty
         * @throws std::logic_error: If n_threads is 0
         */
        explicit DispatchThreadGroupManager(unsigned int n_threads, DispatchFunction dispatch_function = nullptr);
        ~DispatchThreadGroupManager();

        /*!
         * This function starts all worker threads.
         * If called multiple times, it does not do anything.
         */
        void startAllWorkerThreads();

        /*!
         * This function stops all worker threads.
         */
        void stopAllWorkerThreads();

        /*!
         * Distributes the requests to the worker threads and notifies them to start working.
         * The request vector must not be modified until waitForWorkersToFinish() returns.
         */
        void executeBatch(const std::vector<dispatch::DispatchRequest>& requests);

        /*!
         * This function waits until all workers are finished with the batch
         * started with executeBatch() and returns the results in request order.
         */
        std::vector<BatchEntry> waitForWorkersToFinish();

        unsigned int get_n_threads() const { return (unsigned int) worker_threads.size(); }

    private:
        std::vector<DispatchWorkerThread*> worker_threads; ///< Vector of worker threads
        DispatchFunction dispatch_function;
        std::latch* all_workers_finished_latch;
        const std::vector<dispatch::DispatchRequest>* current_requests; ///< The requests of the current batch
        std::vector<BatchEntry> results; ///< One entry per request, each entry is written by exactly one worker
};

/*!
 * This class represents a working thread that calls the dispatch function of the manager
 * for all requests assigned to it on request.
 * The thread sleeps until it is activated using the public method
 * executeAssignedRequests().
 */
class DispatchWorkerThread {
    public:
        explicit DispatchWorkerThread(DispatchThreadGroupManager& caller);
        ~DispatchWorkerThread();
        void start(); ///< Starts this thread. This method has to be called before the call of executeAssignedRequests().
        void stop();  ///< Stops this working thread.

        /*!
         * Notifies the thread to solve the requests with the given indices of the current batch.
         */
        void executeAssignedRequests(const std::list<std::size_t>& request_indices);

    private:
        DispatchThreadGroupManager& thread_group_manager; ///< Internal reference to the thread group manager
        std::list<std::size_t> assigned_requests; ///< Indices of the requests of the current batch, protected by mtx
        std::thread current_thread;
        std::mutex mtx; ///< The mutex object per instance
        std::condition_variable cv; ///< The conditional variable to signal the requests for running, i.e., by calling executeAssignedRequests()
        std::atomic<bool> atomic_flag_stop;    ///< Set to true if the the working thread should stop
        std::atomic<bool> atomic_flag_exec;    ///< Set to true if the assigned requests should be solved
        std::atomic<bool> atomic_flag_running; ///< Set to true if the thread is invoked and running (working or idling)
        //
        void run(); ///< Main internal function for this thread. It is started and stopped with the start()- and stop()-method.
};


/**
 * Solves all requests and returns the results in request order.
 * If n_threads is 0, all requests are solved sequentially in the calling thread,
 * otherwise a DispatchThreadGroupManager with n_threads workers is used.
 * Every exception thrown for a request is stored in its entry.
 */
std::vector<BatchEntry> run_dispatch_batch(const std::vector<dispatch::DispatchRequest>& requests, unsigned int n_threads, DispatchFunction dispatch_function = nullptr);

#endif
