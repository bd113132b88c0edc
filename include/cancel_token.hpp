#ifndef CANCEL_TOKEN_HPP
#define CANCEL_TOKEN_HPP
#include <atomic>

/**
 * @brief Cooperative cancellation flag shared between a queue and a task.
 *
 * Signalling only sets the flag; running commands observe it while they poll
 * their child process and terminate it.
 */
class CancelToken {
  public:
    void cancel() noexcept { cancelled_.store(true); }
    bool cancelled() const noexcept { return cancelled_.load(); }

  private:
    std::atomic<bool> cancelled_{false};
};

#endif // CANCEL_TOKEN_HPP
