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

#ifndef HS_CMDLINE_INTERFACE_H_
#define HS_CMDLINE_INTERFACE_H_


#include <string>
#include <vector>

#include "candidate_selection.h"
#include "cmdline_utility.h"
#include "hit_io.h"
#include "io_options.h"
#include "scoring.h"
#include "taxonomy.h"


namespace hs {


/*************************************************************************//**
 *
 *
 *  S H A R E D
 *
 *
 *****************************************************************************/

/*************************************************************************//**
 * @brief taxonomic information sources
 *****************************************************************************/
struct taxonomy_options
{
    //directory with nodes.dmp, names.dmp and (optional) merged.dmp
    std::string path;
    //individual files take precedence over 'path'
    std::string nodesFile;
    std::string namesFile;
    std::string mergeFile;
    //blobtools nodesDB table; takes precedence over everything else
    std::string nodesDbFile;
};



/*************************************************************************//**
 * @brief ingroup / skip clades and decision thresholds
 *****************************************************************************/
struct scoring_options
{
    //Metazoa
    taxonomy::taxon_id ingroupId = 33208;
    //none
    taxonomy::taxon_id skipId = taxonomy::none_id();

    selection_thresholds thresholds;
};





/*************************************************************************//**
 *
 *
 *  C L A S S I F Y   M O D E
 *
 *
 *****************************************************************************/

/*************************************************************************//**
 *
 * @brief classification of a hit file
 *
 *****************************************************************************/
struct classify_options
{
    std::string hitFile;
    //output file prefix; default: hit file name
    std::string prefix;

    taxonomy_options taxonomy;
    hit_format_options format;
    scoring_options scoring;
    performance_tuning_options performance;

    info_level infoLevel = info_level::moderate;
};



/*************************************************************************//**
 * @brief command line args -> classify options
 *****************************************************************************/
classify_options get_classify_options(const cmdline_args&,
                                      classify_options defaults = {});

std::string classify_mode_usage();
std::string classify_mode_examples();
std::string classify_mode_docs();





/*************************************************************************//**
 *
 *
 *  L I N E A G E   M O D E
 *
 *
 *****************************************************************************/

/*************************************************************************//**
 *
 * @brief lineage / category lookup for individual taxa
 *
 *****************************************************************************/
struct lineage_options
{
    std::vector<hs::taxonomy::taxon_id> taxa;

    taxonomy_options taxonomy;
    hs::taxonomy::taxon_id ingroupId = 33208;

    info_level infoLevel = info_level::silent;
};



/*************************************************************************//**
 * @brief command line args -> lineage options
 *****************************************************************************/
lineage_options get_lineage_options(const cmdline_args&,
                                    lineage_options defaults = {});

std::string lineage_mode_usage();
std::string lineage_mode_examples();
std::string lineage_mode_docs();


} // namespace hs


#endif
