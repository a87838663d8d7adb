#pragma once

#include <cassert>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include "vin/Events.h"
#include "Channel.h"
#include "logging.h"

namespace vin {

using event_sink_t = std::function<void(AppEvent&&)>;

/*! The two channels a worker reads.
 *
 *  `commands` carries the work. `abandoned` carries ids of jobs the StateMachine
 *  has given up on, so the worker can stop spending time on them.
 */
template <typename CmdT>
struct WorkerPort {
    std::shared_ptr<Channel<CmdT>> commands;
    std::shared_ptr<Channel<job_id_t>> abandoned;

    static WorkerPort create(const std::string& name, size_t capacity = 0) {
        return {std::make_shared<Channel<CmdT>>(name + ".commands", capacity),
                std::make_shared<Channel<job_id_t>>(name + ".abandoned")};
    }
};

class WorkerBase {
public:
    explicit WorkerBase(std::string name)
        : name_{std::move(name)} {}
    virtual ~WorkerBase() = default;

    WorkerBase(const WorkerBase&) = delete;
    WorkerBase& operator=(const WorkerBase&) = delete;

    const std::string& name() const noexcept {
        return name_;
    }

private:
    const std::string name_;
};

/*! Base-class for the workers.
 *
 *  Each worker has its own thread that processes commands from its channel in
 *  order. Exceptions from a command are caught on the worker's thread and
 *  reported to the StateMachine as `WorkerFailed`.
 *
 *  Derived classes must call stop() in their destructor.
 */
template <typename CmdT>
class Worker : public WorkerBase {
public:
    using cmd_t = CmdT;
    using port_t = WorkerPort<CmdT>;

    Worker(std::string name, port_t port, event_sink_t emit)
        : WorkerBase(std::move(name)), port_{std::move(port)}, emit_{std::move(emit)}
    {
        assert(port_.commands);
        assert(port_.abandoned);
    }

    void start() {
        assert(!thread_);
        thread_.emplace([this] { run(); });
    }

    // Waits for the thread to exit after a Shutdown command or a closed channel
    void join() {
        if (thread_ && thread_->joinable()) {
            thread_->join();
        }
    }

    // Closes the command channel and waits for the thread
    void stop() {
        port_.commands->close();
        join();
    }

protected:
    virtual void handle(CmdT&& cmd) = 0;

    // If set, onPoll() is called at this interval while no command arrives
    virtual std::optional<std::chrono::milliseconds> pollInterval() const {
        return std::nullopt;
    }

    virtual void onPoll() {}

    // Called on the worker thread before it exits
    virtual void onExit() {}

    void emit(AppEvent&& event) {
        emit_(std::move(event));
    }

    // Ends the command loop after the current command
    void finish() noexcept {
        done_ = true;
    }

    bool finished() const noexcept {
        return done_;
    }

    // Puts a command aside, to be processed after the current one
    void defer(CmdT&& cmd) {
        deferred_.push_back(std::move(cmd));
    }

    // Non-blocking read of the command channel, for use while working
    bool pollCommand(CmdT& cmd) {
        return port_.commands->tryPop(cmd);
    }

    /*! Reads the abandon channel.
     *
     *  @return True if `job` has been abandoned.
     */
    bool isAbandoned(job_id_t job) {
        job_id_t id{};
        while (port_.abandoned->tryPop(id)) {
            if (id <= last_done_) {
                LOG_TRACE_EX(*this) << "Job #" << id << " was abandoned after it was done.";
                continue;
            }
            LOG_DEBUG_EX(*this) << "Job #" << id << " was abandoned.";
            abandoned_.insert(id);
        }
        return job && abandoned_.contains(job);
    }

    void forget(job_id_t job) {
        abandoned_.erase(job);
    }

    /*! Marks the job taken from the command channel as handled.
     *
     *  Jobs are taken in the order they were issued, so abandon notices for this job
     *  or any earlier one can be dropped.
     */
    void done(job_id_t job) {
        if (job > last_done_) {
            last_done_ = job;
            std::erase_if(abandoned_, [this](job_id_t id) { return id <= last_done_; });
        }
    }

    size_t abandonedCount() const noexcept {
        return abandoned_.size();
    }

private:
    bool nextCommand(CmdT& cmd) {
        if (!deferred_.empty()) {
            cmd = std::move(deferred_.front());
            deferred_.pop_front();
            return true;
        }

        while (true) {
            if (const auto interval = pollInterval()) {
                if (port_.commands->popFor(cmd, *interval)) {
                    return true;
                }
                if (port_.commands->closed()) {
                    return false;
                }
                safely([this] { onPoll(); });
                if (done_) {
                    return false;
                }
                continue;
            }

            return port_.commands->pop(cmd);
        }
    }

    void execute(CmdT&& cmd) {
        LOG_TRACE_EX(*this) << "Processing command: " << cmd;
        safely([&] { handle(std::move(cmd)); });
    }

    template <typename FnT>
    void safely(FnT&& fn) {
        try {
            fn();
        } catch (const std::exception& ex) {
            LOG_ERROR_EX(*this) << "Caught exception in command loop: " << ex.what();
            emit(event::WorkerFailed{name(), ex.what()});
        }
    }

    void run() noexcept {
        LOG_DEBUG_EX(*this) << "Worker thread started.";
        while (!done_) {
            CmdT cmd;
            if (!nextCommand(cmd)) {
                LOG_DEBUG_EX(*this) << "Command channel closed.";
                break;
            }
            execute(std::move(cmd));
        }

        safely([this] { onExit(); });
        LOG_DEBUG_EX(*this) << "Worker thread done.";
    }

    port_t port_;
    event_sink_t emit_;
    std::optional<std::jthread> thread_;
    std::deque<CmdT> deferred_;
    std::set<job_id_t> abandoned_;
    job_id_t last_done_{0};
    bool done_{false};
};

} // ns
