// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <chrono>
#include <string>

#include "afdCommon.hpp"
#include "afdUtil.hpp"

namespace afd_sim {

// Wall-clock timer for verbose progress logs. If log_on_exit is set, the
// elapsed time is logged under the timer's name when it goes out of scope.
class ScopedTimer {
   public:
    explicit ScopedTimer(std::string timer_name = "", bool log_on_exit = false) :
        start_time(std::chrono::steady_clock::now()),
        name(std::move(timer_name)),
        log_on_exit(log_on_exit) {}

    ~ScopedTimer() {
        if (log_on_exit) {
            log("{} took {:.3f} ms", name, elapsedMs());
        }
    }

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer &operator=(const ScopedTimer &) = delete;

    void stop() {
        if (not stopped) {
            stopped = true;
            end_time = std::chrono::steady_clock::now();
        }
    }

    // stops the timer on first call; later calls return the same value
    Milliseconds elapsedMs() {
        stop();
        return std::chrono::duration<double, std::milli>(end_time - start_time).count();
    }

   private:
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    std::string name;
    bool stopped = false;
    bool log_on_exit;
};

}  // namespace afd_sim
