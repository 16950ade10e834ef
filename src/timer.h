/******************************************************************************
 *
 * HGTseek - Horizontal Gene Transfer Candidate Detection
 *
 * Copyright (C) 2024 The HGTseek developers
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 *****************************************************************************/

#ifndef HS_TIMER_H_
#define HS_TIMER_H_


#include <chrono>
#include <cstdint>


namespace hs {


/*************************************************************************//**
 *
 * @brief accumulating wall clock stopwatch
 *
 *****************************************************************************/
class timer
{
    using clock = std::chrono::steady_clock;
    using duration_t = std::chrono::milliseconds;

public:
    //---------------------------------------------------------------
    void start() noexcept {
        if(!running_) {
            running_ = true;
            start_ = clock::now();
        }
    }

    void stop() noexcept {
        if(running_) {
            total_ += std::chrono::duration_cast<duration_t>(clock::now() - start_);
            running_ = false;
        }
    }


    //---------------------------------------------------------------
    std::int64_t milliseconds() const noexcept {
        if(!running_) return total_.count();
        return (total_ + std::chrono::duration_cast<duration_t>(
                    clock::now() - start_)).count();
    }

    double seconds() const noexcept {
        return milliseconds() / 1000.0;
    }

private:
    clock::time_point start_;
    duration_t total_ = duration_t(0);
    bool running_ = false;
};


}  // namespace hs


#endif
