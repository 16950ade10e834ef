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


#include "cmdline_utility.h"

#include <chrono>
#include <exception>
#include <future>
#include <iostream>
#include <vector>


namespace hs {


//-------------------------------------------------------------------
cmdline_args make_args_list(char** first, char** last)
{
    cmdline_args args;
    if(last < first) return args;

    args.reserve(last-first);

    for(; first != last; ++first) {
        args.push_back(*first);
    }

    return args;
}



//-------------------------------------------------------------------
std::string with_thousands_separators(std::size_t n)
{
    auto digits = std::to_string(n);
    std::string res;
    res.reserve(digits.size() + digits.size() / 3);

    const auto lead = digits.size() % 3;
    for(std::size_t i = 0; i < digits.size(); ++i) {
        if(i > 0 && (i % 3) == lead) res += ',';
        res += digits[i];
    }
    return res;
}



//-------------------------------------------------------------------
void show_progress_indicator(std::ostream& os, float done, int totalLength)
{
    if(done < 0.f) done = 0.f;
    if(done > 1.f) done = 1.f;
    auto m = int((totalLength - 7) * done);
    os << "\r[";
    for(int j = 0; j < m; ++j) os << '=';
    os << ">";
    m = totalLength - 7 - m;
    for(int j = 0; j < m; ++j) os << ' ';
    os << "] " << int(100 * done) << "%" << std::flush;
}



//-------------------------------------------------------------------
void clear_current_line(std::ostream& os, int length)
{
    os << '\r';
    for(; length > 0; --length) os << ' ';
    os << '\r' << std::flush;
}



//-------------------------------------------------------------------
void show_progress_until_ready(std::ostream& os, concurrent_progress& progress,
                               std::vector<std::future<void>>& futures)
{
    progress.show(os);

    std::exception_ptr firstError;
    std::size_t readyCounter = 0;
    std::vector<bool> done(futures.size(), false);

    while(readyCounter != futures.size()) {
        for(std::size_t i = 0; i < futures.size(); ++i) {
            if(done[i]) continue;

            if(futures[i].wait_for(std::chrono::milliseconds(500))
               == std::future_status::ready)
            {
                done[i] = true;
                ++readyCounter;
                try {
                    futures[i].get();
                }
                catch(...) {
                    if(!firstError) firstError = std::current_exception();
                }
            }
            else {
                progress.show(os);
            }
        }
    }
    progress.clear_line(os);

    if(firstError) std::rethrow_exception(firstError);
}


} // namespace hs
