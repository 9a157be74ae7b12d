/* **********************************************************
 * Copyright (c) 2026 Google, Inc.  All rights reserved.
 * **********************************************************/

/*
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice,
 *   this list of conditions and the following disclaimer.
 *
 * * Redistributions in binary form must reproduce the above copyright notice,
 *   this list of conditions and the following disclaimer in the documentation
 *   and/or other materials provided with the distribution.
 *
 * * Neither the name of Google, Inc. nor the names of its contributors may be
 *   used to endorse or promote products derived from this software without
 *   specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL VMWARE, INC. OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 * LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY
 * OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH
 * DAMAGE.
 */
/* directory_iterator: walks the entries of a directory and provides the
 * filesystem helpers the recorder needs for its temporary directory.
 */

#ifndef _DIRECTORY_ITERATOR_H_
#define _DIRECTORY_ITERATOR_H_ 1

#include <dirent.h> /* opendir, readdir */

#include <cstddef>
#include <iterator>
#include <string>

#include "utils.h"

namespace fibertrace {

// Iterates over every entry but "." and "..", including sub-directories.
// Returns the basenames of the entries (i.e., not absolute paths).
// This class is not thread-safe.
class directory_iterator_t {
public:
    typedef std::input_iterator_tag iterator_category;
    typedef std::string value_type;
    typedef std::ptrdiff_t difference_type;
    typedef const std::string *pointer;
    typedef const std::string &reference;

    directory_iterator_t()
    {
    }
    virtual ~directory_iterator_t();

    explicit directory_iterator_t(const std::string &directory);

    directory_iterator_t(const directory_iterator_t &) = delete;
    directory_iterator_t &
    operator=(const directory_iterator_t &) = delete;

    std::string
    error_string() const
    {
        return error_descr_;
    }

    virtual const std::string &
    operator*();

    virtual bool
    operator==(const directory_iterator_t &rhs) const
    {
        return BOOLS_MATCH(at_eof_, rhs.at_eof_);
    }
    virtual bool
    operator!=(const directory_iterator_t &rhs) const
    {
        return !BOOLS_MATCH(at_eof_, rhs.at_eof_);
    }

    virtual directory_iterator_t &
    operator++();

    virtual bool
    operator!()
    {
        return at_eof_;
    }

    // We do not bother to support the post-increment operator.

    // Static utility functions.
    static bool
    is_directory(const std::string &path);
    static bool
    file_exists(const std::string &path);
    // Recursively creates all sub-directories.
    static bool
    create_directory(const std::string &path);
    // Recursively removes path and everything below it.  Symlinks are removed,
    // never followed.  Returns "" on success or a description of the first
    // failure; a missing path is not a failure.
    static std::string
    remove_tree(const std::string &path);

private:
    bool at_eof_ = true;
    std::string error_descr_;
    std::string cur_file_;
    DIR *dir_ = nullptr;
    struct dirent *ent_ = nullptr;
};

} // namespace fibertrace

#endif /* _DIRECTORY_ITERATOR_H_ */
