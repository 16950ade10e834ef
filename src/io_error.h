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

#ifndef HS_IO_ERROR_H_
#define HS_IO_ERROR_H_


#include <cstdint>
#include <string>
#include <stdexcept>


namespace hs {


/*************************************************************************//**
 *
 *
 *
 *****************************************************************************/
class io_error :
    public std::runtime_error
{
public:
    explicit
    io_error(const std::string& what):
        std::runtime_error(what)
    {}
};



/*************************************************************************//**
 *
 * @brief input data does not follow the expected (tabular) format
 *
 *****************************************************************************/
class io_format_error :
    public io_error
{
public:
    explicit
    io_format_error(const std::string& what):
        io_error(what)
    {}

};



/*************************************************************************//**
 *
 *
 *
 *****************************************************************************/
class file_io_error :
    public io_error
{
public:
    explicit
    file_io_error(const std::string& what):
        io_error(what)
    {}

    explicit
    file_io_error(const std::string& what, const std::string& filename):
        io_error(what), filename_(filename)
    {}

    const char* filename() const noexcept {
        return filename_.c_str();
    }

private:
    std::string filename_;
};



/*************************************************************************//**
 *
 *
 *
 *****************************************************************************/
class file_access_error :
    public file_io_error
{
public:
    explicit
    file_access_error(const std::string& what):
        file_io_error(what)
    {}

    explicit
    file_access_error(const std::string& what, const std::string& filename):
        file_io_error(what,filename)
    {}
};



/*************************************************************************//**
 *
 *
 *
 *****************************************************************************/
class file_read_error :
    public file_io_error
{
public:
    explicit
    file_read_error(const std::string& what):
        file_io_error(what)
    {}

    explicit
    file_read_error(const std::string& what, const std::string& filename):
        file_io_error(what,filename)
    {}
};



/*************************************************************************//**
 *
 *
 *
 *****************************************************************************/
class file_write_error :
    public file_io_error
{
public:
    explicit
    file_write_error(const std::string& what):
        file_io_error(what)
    {}

    explicit
    file_write_error(const std::string& what, const std::string& filename):
        file_io_error(what,filename)
    {}
};



/*************************************************************************//**
 *
 * @brief taxonomy content is inconsistent with the requested operation
 *        (e.g. threshold taxon not present)
 *
 *****************************************************************************/
class taxonomy_error :
    public std::runtime_error
{
public:
    explicit
    taxonomy_error(const std::string& what):
        std::runtime_error(what)
    {}
};



/*************************************************************************//**
 *
 * @brief an ancestor chain is cyclic or interrupted by an unknown taxon
 *
 *****************************************************************************/
class malformed_taxonomy :
    public taxonomy_error
{
public:
    explicit
    malformed_taxonomy(const std::string& what, std::int_least64_t taxonId):
        taxonomy_error(what), taxonId_{taxonId}
    {}

    std::int_least64_t taxon_id() const noexcept { return taxonId_; }

private:
    std::int_least64_t taxonId_;
};


}  // namespace hs



#endif
