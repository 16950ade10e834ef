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

#ifndef HS_TAXONOMY_IO_H_
#define HS_TAXONOMY_IO_H_


#include <string>

#include "taxonomy.h"
#include "io_options.h"


namespace hs {

struct taxonomy_options;


/*************************************************************************//**
 *
 * @brief reads taxonomic tree + names from NCBI's taxnonomy files
 *        (nodes.dmp, names.dmp, merged.dmp);
 *        plain or gzip compressed
 *
 * @details only names of class "scientific name" are used;
 *          merged ids are made direct children of their new ids
 *          after all nodes have been read
 *
 * @throws file_access_error if the nodes file (or a given names/merged file)
 *         can't be opened
 *         io_format_error if no valid taxon record could be read
 *
 *****************************************************************************/
taxonomy
make_taxonomic_hierarchy(const std::string& taxNodesFile,
                         const std::string& taxNamesFile = "",
                         const std::string& mergeTaxFile = "",
                         info_level info = info_level::moderate);



/*************************************************************************//**
 *
 * @brief reads a blobtools "nodesDB" table
 *        (taxon id <TAB> rank <TAB> name <TAB> parent id)
 *
 *****************************************************************************/
taxonomy
make_taxonomic_hierarchy_from_nodesdb(const std::string& nodesDbFile,
                                      info_level info = info_level::moderate);



/*************************************************************************//**
 *
 * @brief builds taxonomy from whichever source the options name;
 *        individual files take precedence over a taxonomy directory
 *
 *****************************************************************************/
taxonomy
read_taxonomy(const taxonomy_options&, info_level info = info_level::moderate);


} // namespace hs


#endif
