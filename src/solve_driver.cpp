#include "solve_driver.hpp"

#include <stdexcept>
#include <utility>

std::size_t drainSteps(StepSequence& sequence, const StepSink& sink, const std::atomic<bool>& stop) {
    std::size_t delivered = 0;
    while (auto step = sequence.next()) {
        if (stop.load()) break;
        sink(*step);
        ++delivered;
        if (step->isTerminal()) break;
    }
    return delivered;
}

SolveDriver::SolveDriver(std::unique_ptr<StepSequence> sequence, std::chrono::milliseconds delay)
    : sequence(std::move(sequence)), delay(delay) {
    if (!this->sequence) throw std::invalid_argument("SolveDriver: no step sequence");
}

SolveDriver::~SolveDriver() {
    stop();
    if (worker.joinable()) worker.join();
}

void SolveDriver::start() {
    if (worker.joinable()) throw std::logic_error("SolveDriver: already started");
    worker = std::thread([this]() { run(); });
}

void SolveDriver::stop() {
    stopFlag.store(true);
    std::lock_guard<std::mutex> lock(mu);
    wake.notify_all();
}

void SolveDriver::run() {
    try {
        while (auto step = sequence->next()) {
            if (stopFlag.load()) break;
            const bool terminal = step->isTerminal();
            {
                std::lock_guard<std::mutex> lock(mu);
                queue.push_back(std::move(*step));
            }
            ready.notify_all();
            if (terminal) break;

            if (delay.count() > 0) {
                std::unique_lock<std::mutex> lock(mu);
                wake.wait_for(lock, delay, [this]() { return stopFlag.load(); });
            }
        }
    } catch (...) {
        std::lock_guard<std::mutex> lock(mu);
        error = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(mu);
        workerDone = true;
    }
    ready.notify_all();
}

bool SolveDriver::finished() const {
    std::lock_guard<std::mutex> lock(mu);
    return workerDone && queue.empty();
}

std::size_t SolveDriver::deliver(std::deque<SolveStep> pending, const StepSink& sink) {
    for (const SolveStep& step : pending) sink(step);

    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(mu);
        if (queue.empty() && workerDone) std::swap(failure, error);
    }
    if (failure) std::rethrow_exception(failure);
    return pending.size();
}

std::size_t SolveDriver::poll(const StepSink& sink) {
    std::deque<SolveStep> pending;
    {
        std::lock_guard<std::mutex> lock(mu);
        pending.swap(queue);
    }
    return deliver(std::move(pending), sink);
}

std::size_t SolveDriver::waitAndPoll(const StepSink& sink, std::chrono::milliseconds timeout) {
    std::deque<SolveStep> pending;
    {
        std::unique_lock<std::mutex> lock(mu);
        ready.wait_for(lock, timeout, [this]() { return !queue.empty() || workerDone; });
        pending.swap(queue);
    }
    return deliver(std::move(pending), sink);
}

std::size_t SolveDriver::join(const StepSink& sink) {
    if (worker.joinable()) worker.join();
    return poll(sink);
}
