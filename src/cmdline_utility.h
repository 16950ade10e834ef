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

#ifndef HS_CMDLINE_TOOLS_H_
#define HS_CMDLINE_TOOLS_H_


#include <algorithm>
#include <atomic>
#include <cstddef>
#include <future>
#include <iosfwd>
#include <string>
#include <vector>


namespace hs {


using cmdline_args = std::vector<std::string>;



/*************************************************************************//**
 *
 * @brief make args C-array into vector of strings
 *
 *****************************************************************************/
cmdline_args make_args_list(char** first, char** last);



/*************************************************************************//**
 *
 * @brief formats count with thousands separators: 1234567 -> 1,234,567
 *
 *****************************************************************************/
std::string with_thousands_separators(std::size_t n);



/*************************************************************************//**
 *
 * @brief prints a progress indicator like this:  [====>   ] 50%
 *
 *****************************************************************************/
void show_progress_indicator(std::ostream&, float done, int totalLength = 80);

void clear_current_line(std::ostream&, int length = 80);



/*************************************************************************//**
 *
 * @brief show progress on single thread, updateable from multiple threads
 *
 *****************************************************************************/
struct concurrent_progress {
    std::atomic_size_t counter{0};
    std::atomic_size_t total{0};
    bool initialized{false};

    float progress() const {
        if(total < 1) return 0.0f;
        return std::min(1.0f, float(counter)/total);
    }

    void show(std::ostream& os) {
        initialized = true;
        show_progress_indicator(os, progress());
    }

    void clear_line(std::ostream& os) const {
        if(initialized) clear_current_line(os);
    }
};



/*************************************************************************//**
 *
 * @brief show progress on single thread until all futures are ready;
 *        exceptions thrown by workers are re-thrown after all have finished
 *
 *****************************************************************************/
void show_progress_until_ready(std::ostream& os, concurrent_progress& progress,
                               std::vector<std::future<void>>& futures);


} // namespace hs


#endif
