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

#ifndef HS_LINE_ISTREAM_H_
#define HS_LINE_ISTREAM_H_

#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>


namespace hs {


/*************************************************************************//**
 *
 * @brief buffered line reader for plain or gzip compressed text files;
 *        zlib reads uncompressed files transparently
 *
 *****************************************************************************/
class line_istream
{
public:
    enum class status : char {
        no_err   = 0, // no error
        eof      = 1, // end-of-file
        err      = 2  // error reading stream
    };

private:
    struct filehandle
    {
        filehandle() : file_{nullptr} {}

        filehandle(filehandle&& other) :
            file_{other.file_}
        {
            other.file_ = nullptr;
        }

        filehandle& operator = (filehandle&& other) {
            std::swap(file_, other.file_);
            return *this;
        }

        filehandle(const filehandle&) = delete;
        filehandle& operator = (const filehandle&) = delete;

        ~filehandle() {
            if(file_) close();
        }

        status open(const char *filename) {
            if(file_) close();
            file_ = gzopen(filename, "r");
            if(file_ == Z_NULL) return status::err;
            return status::no_err;
        }

        void close() {
            gzclose(file_);
            file_ = nullptr;
        }

        int read(void *buffer, unsigned size) {
            return gzread(file_, buffer, size);
        }

        std::int_least64_t raw_offset() const {
            return file_ ? std::int_least64_t(gzoffset(file_)) : 0;
        }

        gzFile file_;
    };

    static constexpr unsigned bufsize() noexcept {
        return 16384;
    }

public:
    line_istream() :
        filehandle_{}, buf_{nullptr},
        begin_{0}, end_{0},
        lineNum_{0},
        status_{status::err}
    {}

    explicit
    line_istream(const std::string& filename) : line_istream()
    {
        open(filename);
    }

    line_istream(line_istream&&) = default;
    line_istream& operator = (line_istream&&) = default;


    //---------------------------------------------------------------
    void open(const std::string& filename) {
        status_ = filehandle_.open(filename.c_str());
        buf_ = std::make_unique<unsigned char[]>(bufsize());
        begin_ = 0;
        end_ = 0;
        lineNum_ = 0;
    }

    status state() const noexcept { return status_; }
    bool good() const noexcept { return status_ == status::no_err; }
    bool failed() const noexcept { return status_ == status::err; }

    /// 1-based number of the last line returned by getline
    std::size_t line_number() const noexcept { return lineNum_; }

    /// number of (compressed) bytes consumed so far
    std::int_least64_t raw_position() const { return filehandle_.raw_offset(); }


    //---------------------------------------------------------------
    /**
     * @brief reads next line (without line terminator) into 'line'
     * @return false if no more lines could be read
     */
    bool getline(std::string& line)
    {
        line.clear();
        bool gotany = false;
        for(;;) {
            if(!validate_buffer()) break;

            auto sep = static_cast<unsigned char*>(
                std::memchr(buf_.get() + begin_, '\n', end_ - begin_));

            int lineEnd = (sep != nullptr) ? int(sep - buf_.get()) : end_;

            line.append(reinterpret_cast<char*>(buf_.get()) + begin_,
                        lineEnd - begin_);

            gotany = true;
            begin_ = lineEnd + 1;

            if(lineEnd < end_) break;
            // else: line continues in next buffer
        }
        if(!gotany) return false;

        if(!line.empty() && line.back() == '\r') line.pop_back();
        ++lineNum_;
        return true;
    }


private:
    bool buffer_empty() const noexcept { return begin_ >= end_; }

    bool validate_buffer() {
        if(status_ != status::no_err) return false;

        if(buffer_empty()) {
            begin_ = 0;
            end_ = filehandle_.read(buf_.get(), bufsize());

            if(end_ == 0) { // nothing read
                status_ = status::eof;
                return false;
            }
            if(end_ < 0) { // read error
                end_ = 0;
                status_ = status::err;
                return false;
            }
        }
        return true;
    }


    filehandle filehandle_;
    std::unique_ptr<unsigned char[]> buf_;
    int begin_;
    int end_;
    std::size_t lineNum_;
    status status_;
};


}  // namespace hs


#endif
