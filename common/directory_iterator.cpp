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
#include "directory_iterator.h"

#include <dirent.h>
#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>

#include "utils.h"

namespace fibertrace {

// Following typical stream iterator convention, the default constructor
// produces an EOF object.
directory_iterator_t::directory_iterator_t(const std::string &directory)
{
    dir_ = opendir(directory.c_str());
    if (dir_ == nullptr) {
        error_descr_ = "Failed to access directory " + directory + ": " + strerror(errno);
        return;
    }
    at_eof_ = false;
    ++*this;
}

directory_iterator_t::~directory_iterator_t()
{
    if (dir_ != nullptr)
        closedir(dir_);
}

// Work around clang-format bug: no newline after return type for single-char operator.
// clang-format off
const std::string &
directory_iterator_t::operator*()
// clang-format on
{
    return cur_file_;
}

directory_iterator_t &
directory_iterator_t::operator++()
{
    if (dir_ == nullptr) {
        at_eof_ = true;
        return *this;
    }
    do {
        ent_ = readdir(dir_);
    } while (ent_ != nullptr &&
             (strcmp(ent_->d_name, ".") == 0 || strcmp(ent_->d_name, "..") == 0));
    if (ent_ == nullptr)
        at_eof_ = true;
    else
        cur_file_ = ent_->d_name;
    return *this;
}

bool
directory_iterator_t::is_directory(const std::string &path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool
directory_iterator_t::file_exists(const std::string &path)
{
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

bool
directory_iterator_t::create_directory(const std::string &path)
{
    // Create all components.
    auto pos = path.find(DIRSEP, 1);
    while (pos != std::string::npos) {
        std::string sub = path.substr(0, pos);
        if (!is_directory(sub)) {
            if (mkdir(sub.c_str(), 0755) != 0 && errno != EEXIST)
                return false;
        }
        pos = path.find(DIRSEP, pos + 1);
    }
    return mkdir(path.c_str(), 0755) == 0 || (errno == EEXIST && is_directory(path));
}

std::string
directory_iterator_t::remove_tree(const std::string &path)
{
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT)
            return "";
        return "Failed to stat " + path + ": " + strerror(errno);
    }
    if (!S_ISDIR(st.st_mode)) {
        if (unlink(path.c_str()) != 0 && errno != ENOENT)
            return "Failed to remove " + path + ": " + strerror(errno);
        return "";
    }
    std::string error;
    {
        directory_iterator_t iter(path);
        if (!iter.error_string().empty())
            return iter.error_string();
        for (; iter != directory_iterator_t(); ++iter) {
            std::string res = remove_tree(path + DIRSEP + *iter);
            // Keep going so that as much as possible is removed.
            if (!res.empty() && error.empty())
                error = res;
        }
    }
    if (rmdir(path.c_str()) != 0 && errno != ENOENT && error.empty())
        error = "Failed to remove directory " + path + ": " + strerror(errno);
    return error;
}

} // namespace fibertrace
