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

#ifndef HS_MODES_H_
#define HS_MODES_H_


#include "cmdline_utility.h"


namespace hs {


/*************************************************************************//**
 *
 * @brief classifies the queries of a hit file and selects HGT candidates
 *
 *****************************************************************************/
void main_mode_classify(const cmdline_args&);



/*************************************************************************//**
 *
 * @brief shows category and lineages of individual taxa
 *
 *****************************************************************************/
void main_mode_lineage(const cmdline_args&);



/*************************************************************************//**
 *
 * @brief help
 *
 *****************************************************************************/
void main_mode_help(const cmdline_args&);


} // namespace hs


#endif
