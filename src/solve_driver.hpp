#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "solve_step.hpp"

using StepSink = std::function<void(const SolveStep&)>;

// Pulls every step from a sequence into sink on the calling thread, checking
// stop after each produced step. Returns the number of steps delivered.
std::size_t drainSteps(StepSequence& sequence, const StepSink& sink, const std::atomic<bool>& stop);

/**
 * Runs a step sequence on its own thread and hands the steps to whichever
 * thread calls poll(), in production order.
 *
 * The worker sleeps for the pacing delay after each step and checks the stop
 * flag once per produced step; a step produced after stop() is dropped. An
 * exception thrown by the sequence ends the worker and is rethrown on the
 * consuming thread once the steps before it have been delivered.
 */
class SolveDriver {
public:
    explicit SolveDriver(std::unique_ptr<StepSequence> sequence,
                         std::chrono::milliseconds delay = std::chrono::milliseconds(0));
    ~SolveDriver();

    SolveDriver(const SolveDriver&) = delete;
    SolveDriver& operator=(const SolveDriver&) = delete;

    void start();
    void stop();
    bool stopRequested() const { return stopFlag.load(); }

    // True once the worker has ended and every step has been polled.
    bool finished() const;

    std::size_t poll(const StepSink& sink);
    std::size_t waitAndPoll(const StepSink& sink, std::chrono::milliseconds timeout);

    // Waits for the worker, then delivers what is left to sink.
    std::size_t join(const StepSink& sink);

private:
    void run();
    std::size_t deliver(std::deque<SolveStep> pending, const StepSink& sink);

    std::unique_ptr<StepSequence> sequence;
    std::chrono::milliseconds delay;
    std::atomic<bool> stopFlag{false};
    std::thread worker;

    mutable std::mutex mu;
    std::condition_variable ready;
    std::condition_variable wake;
    std::deque<SolveStep> queue;
    bool workerDone = false;
    std::exception_ptr error;
};
