#include "Optimization/Deadline.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

Deadline::Deadline(realtype budget_seconds, Clock clock) : clock(std::move(clock)), budget_seconds(budget_seconds) {
    if (!this->clock) {
        throw std::invalid_argument("Deadline requires a clock");
    }
    if (std::isnan(budget_seconds)) {
        throw std::invalid_argument("Deadline budget must not be NaN");
    }
    start = this->clock();
}

realtype Deadline::elapsedSeconds() const { return std::chrono::duration<realtype>(clock() - start).count(); }

bool Deadline::expired() const { return elapsedSeconds() >= budget_seconds; }

realtype Deadline::remainingSeconds() const { return std::max(budget_seconds - elapsedSeconds(), realtype(0.0)); }
