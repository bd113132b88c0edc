#ifndef OPERATION_QUEUE_HPP
#define OPERATION_QUEUE_HPP
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include "cancel_token.hpp"
#include "repo.hpp"

/**
 * @brief Serializes work per repository while letting repositories overlap.
 *
 * Every repository id owns a lane: a FIFO of pending tasks drained by a
 * dedicated worker thread that exists only while the lane has work; idle
 * lanes are erased. A shared
 * watchdog thread signals the running task's token once its queue timeout
 * elapses. Task bodies receive that token and must pass it to every command
 * they run.
 *
 * Bodies are settled strictly after the finish callback has run, so a caller
 * woken by the returned future already observes the repository as idle.
 */
class OperationQueue {
  public:
    using StartCallback = std::function<void(const std::string&, const ActiveOperation&)>;
    using FinishCallback = std::function<void(const std::string&, const std::string&)>;

    explicit OperationQueue(StartCallback on_start = {}, FinishCallback on_finish = {});
    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    /**
     * @brief Queue @p body for @p repo_id.
     *
     * @param name    Label shown as the active operation.
     * @param body    Callable taking `const CancelToken&`.
     * @param timeout Queue-level limit after which the token is signalled.
     * @return Future with the body's value or exception, or a
     *         `CancelledError` if the task was removed before starting.
     */
    template <typename Fn>
    auto enqueue(const std::string& repo_id, const std::string& name, Fn body,
                 std::chrono::milliseconds timeout)
        -> std::future<std::invoke_result_t<Fn, const CancelToken&>> {
        using T = std::invoke_result_t<Fn, const CancelToken&>;
        auto promise = std::make_shared<std::promise<T>>();
        auto future = promise->get_future();
        auto task = std::make_shared<Task>();
        task->id = new_id("op");
        task->name = name;
        task->timeout = timeout;
        task->run = [promise, body = std::move(body)](const CancelToken& token) mutable
            -> std::function<void()> {
            try {
                if constexpr (std::is_void_v<T>) {
                    body(token);
                    return [promise] { promise->set_value(); };
                } else {
                    auto value = std::make_shared<T>(body(token));
                    return [promise, value] { promise->set_value(std::move(*value)); };
                }
            } catch (...) {
                auto error = std::current_exception();
                return [promise, error] { promise->set_exception(error); };
            }
        };
        task->fail = [promise](std::exception_ptr error) { promise->set_exception(error); };
        submit(repo_id, std::move(task));
        return future;
    }

    /**
     * @brief Cancel the running task of @p repo_id and drop its queued ones.
     *
     * The running task is only signalled; dropped tasks settle immediately
     * with `CancelledError("Operation cancelled before execution")`.
     */
    void cancel_repository(const std::string& repo_id);

    /** @return Number of tasks waiting (not running) for @p repo_id. */
    std::size_t pending(const std::string& repo_id) const;

    /** @return `true` while a task of @p repo_id is running. */
    bool running(const std::string& repo_id) const;

    /** @return Number of repositories with queued or running work. */
    std::size_t lane_count() const;

  private:
    struct Task {
        std::string id;
        std::string name;
        std::chrono::milliseconds timeout{0};
        // Runs the body and returns the deferred settlement of its future.
        std::function<std::function<void()>(const CancelToken&)> run;
        std::function<void(std::exception_ptr)> fail;
    };

    struct Lane {
        std::deque<std::shared_ptr<Task>> pending;
        std::shared_ptr<CancelToken> token; ///< Token of the running task
        std::thread worker;
        bool active = false;
    };

    struct Deadline {
        std::chrono::steady_clock::time_point at;
        std::shared_ptr<CancelToken> token;
        std::string repo_id;
    };

    void submit(const std::string& repo_id, std::shared_ptr<Task> task);
    std::vector<std::thread> take_finished();
    static void reap(std::vector<std::thread>& exited);
    void drain(std::string repo_id);
    void watchdog_loop();

    StartCallback on_start_;
    FinishCallback on_finish_;
    mutable std::mutex mtx_;
    std::condition_variable watchdog_cv_;
    std::map<std::string, Lane> lanes_;
    std::map<std::string, Deadline> deadlines_; ///< Keyed by task id
    std::vector<std::thread> finished_;         ///< Workers of erased lanes, not yet joined
    bool stopping_ = false;
    std::thread watchdog_;
};

#endif // OPERATION_QUEUE_HPP
