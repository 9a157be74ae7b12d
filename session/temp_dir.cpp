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
#include "temp_dir.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>

#include "directory_iterator.h"
#include "utils.h"

namespace fibertrace {

temp_dir_t::~temp_dir_t()
{
    std::string error = remove();
    if (!error.empty())
        WARN("%s", error.c_str());
}

std::string
temp_dir_t::create(const std::string &parent_in)
{
    if (!path_.empty())
        return "Temporary directory " + path_ + " already exists";
    std::string parent = parent_in;
    if (parent.empty()) {
        const char *env = getenv("TMPDIR");
        parent = (env != nullptr && env[0] != '\0') ? env : "/tmp";
    }
    std::string templ = parent + DIRSEP TEMP_DIR_PREFIX "XXXXXX";
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr)
        return "Failed to create a directory in " + parent + ": " + strerror(errno);
    path_ = buf.data();
    VPRINT(1, "Created temporary directory %s\n", path_.c_str());
    return "";
}

std::string
temp_dir_t::remove()
{
    if (path_.empty())
        return "";
    std::string error = directory_iterator_t::remove_tree(path_);
    if (!error.empty())
        return error;
    VPRINT(1, "Removed temporary directory %s\n", path_.c_str());
    path_.clear();
    return "";
}

} // namespace fibertrace
