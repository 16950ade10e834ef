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

#include <iostream>

#include "classification.h"
#include "filesys_utility.h"
#include "io_error.h"
#include "options.h"
#include "taxonomy_io.h"
#include "timer.h"


namespace hs {


//-------------------------------------------------------------------
void main_mode_classify(const cmdline_args& args)
{
    auto opt = get_classify_options(args);

    if(!file_readable(opt.hitFile)) {
        throw file_access_error{"Could not read hit file " + opt.hitFile,
                                opt.hitFile};
    }

    timer time;
    time.start();

    auto tax = read_taxonomy(opt.taxonomy, opt.infoLevel);

    run_classification(tax, opt);

    time.stop();

    if(opt.infoLevel != info_level::silent) {
        std::cout << "Classification finished in "
                  << time.seconds() << " s" << std::endl;
    }
}


} // namespace hs
