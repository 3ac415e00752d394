#ifndef DEADLINE_HPP
#define DEADLINE_HPP

#include <sundials/sundials_types.h>

#include <chrono>
#include <functional>
#include <limits>

/**
 * @brief Shared wall-clock budget of one optimization run
 *
 * Started on construction. The clock is injectable so that tests can move time explicitly.
 * Expiry is only observed where callers poll expired(); nothing is interrupted.
 */
class Deadline {
   public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static std::chrono::steady_clock::time_point steadyNow() { return std::chrono::steady_clock::now(); }

    explicit Deadline(realtype budget_seconds = std::numeric_limits<realtype>::infinity(), Clock clock = steadyNow);

    bool expired() const;
    realtype elapsedSeconds() const;
    realtype remainingSeconds() const;
    realtype budgetSeconds() const { return budget_seconds; }

   private:
    Clock clock;
    std::chrono::steady_clock::time_point start;
    realtype budget_seconds;
};

#endif  // DEADLINE_HPP
