#include "operation_queue.hpp"

#include <vector>

#include "errors.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace {
const char* const kCancelledBeforeStart = "Operation cancelled before execution";
}

OperationQueue::OperationQueue(StartCallback on_start, FinishCallback on_finish)
    : on_start_(std::move(on_start)), on_finish_(std::move(on_finish)) {
    watchdog_ = std::thread([this] { watchdog_loop(); });
}

OperationQueue::~OperationQueue() {
    std::vector<std::shared_ptr<Task>> dropped;
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
        for (auto& [id, lane] : lanes_) {
            if (lane.token)
                lane.token->cancel();
            for (auto& task : lane.pending)
                dropped.push_back(std::move(task));
            lane.pending.clear();
            if (lane.worker.joinable())
                workers.push_back(std::move(lane.worker));
        }
        for (auto& w : finished_)
            workers.push_back(std::move(w));
        finished_.clear();
    }
    watchdog_cv_.notify_all();
    for (auto& task : dropped)
        task->fail(std::make_exception_ptr(CancelledError(kCancelledBeforeStart)));
    for (auto& w : workers)
        w.join();
    if (watchdog_.joinable())
        watchdog_.join();
}

void OperationQueue::submit(const std::string& repo_id, std::shared_ptr<Task> task) {
    std::vector<std::thread> exited;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!stopping_) {
            Lane& lane = lanes_[repo_id];
            lane.pending.push_back(std::move(task));
            if (!lane.active) {
                lane.active = true;
                lane.worker = std::thread([this, repo_id] { drain(repo_id); });
            }
            exited = take_finished();
        }
    }
    reap(exited);
    if (task)
        task->fail(std::make_exception_ptr(CancelledError(kCancelledBeforeStart)));
}

std::vector<std::thread> OperationQueue::take_finished() {
    std::vector<std::thread> exited;
    const auto self = std::this_thread::get_id();
    for (auto it = finished_.begin(); it != finished_.end();) {
        if (it->get_id() == self) {
            ++it;
            continue;
        }
        exited.push_back(std::move(*it));
        it = finished_.erase(it);
    }
    return exited;
}

void OperationQueue::reap(std::vector<std::thread>& exited) {
    for (auto& w : exited) {
        if (w.joinable())
            w.join();
    }
}

void OperationQueue::drain(std::string repo_id) {
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
        Lane& lane = lanes_[repo_id];
        if (stopping_) {
            lane.active = false;
            return;
        }
        if (lane.pending.empty()) {
            // Idle lanes are dropped; the next submit starts a fresh one.
            finished_.push_back(std::move(lane.worker));
            lanes_.erase(repo_id);
            return;
        }
        auto task = std::move(lane.pending.front());
        lane.pending.pop_front();
        auto token = std::make_shared<CancelToken>();
        lane.token = token;
        deadlines_[task->id] =
            Deadline{std::chrono::steady_clock::now() + task->timeout, token, repo_id};
        lk.unlock();
        watchdog_cv_.notify_all();

        ActiveOperation op{task->id, task->name, iso_timestamp()};
        if (logger_initialized())
            log_debug("Operation started", {{"repo", repo_id}, {"op", task->name}});
        if (on_start_)
            on_start_(repo_id, op);
        auto settle = task->run(*token);

        lk.lock();
        deadlines_.erase(task->id);
        lanes_[repo_id].token.reset();
        lk.unlock();
        if (on_finish_)
            on_finish_(repo_id, task->id);
        if (logger_initialized())
            log_debug("Operation finished", {{"repo", repo_id}, {"op", task->name}});
        settle();
        lk.lock();
    }
}

void OperationQueue::watchdog_loop() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopping_) {
        if (deadlines_.empty()) {
            watchdog_cv_.wait(lk);
            continue;
        }
        auto next = deadlines_.begin();
        for (auto it = deadlines_.begin(); it != deadlines_.end(); ++it) {
            if (it->second.at < next->second.at)
                next = it;
        }
        if (std::chrono::steady_clock::now() >= next->second.at) {
            next->second.token->cancel();
            if (logger_initialized())
                log_warning("Operation exceeded queue timeout", {{"repo", next->second.repo_id},
                                                                 {"op", next->first}});
            deadlines_.erase(next);
            continue;
        }
        const auto wake_at = next->second.at;
        watchdog_cv_.wait_until(lk, wake_at);
    }
}

void OperationQueue::cancel_repository(const std::string& repo_id) {
    std::deque<std::shared_ptr<Task>> dropped;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = lanes_.find(repo_id);
        if (it == lanes_.end())
            return;
        if (it->second.token)
            it->second.token->cancel();
        dropped.swap(it->second.pending);
    }
    if (logger_initialized())
        log_info("Repository operations cancelled",
                 {{"repo", repo_id}, {"dropped", std::to_string(dropped.size())}});
    for (auto& task : dropped)
        task->fail(std::make_exception_ptr(CancelledError(kCancelledBeforeStart)));
}

std::size_t OperationQueue::pending(const std::string& repo_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = lanes_.find(repo_id);
    return it == lanes_.end() ? 0 : it->second.pending.size();
}

bool OperationQueue::running(const std::string& repo_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = lanes_.find(repo_id);
    return it != lanes_.end() && it->second.token != nullptr;
}

std::size_t OperationQueue::lane_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lanes_.size();
}
