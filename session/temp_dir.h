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
/* temp_dir_t: a private directory that is removed with everything in it. */

#ifndef _TEMP_DIR_H_
#define _TEMP_DIR_H_ 1

#include <string>

namespace fibertrace {

#define TEMP_DIR_PREFIX "fibertrace-"

class temp_dir_t {
public:
    explicit temp_dir_t(unsigned int verbosity = 0)
        : verbosity_(verbosity)
    {
    }
    ~temp_dir_t();

    temp_dir_t(const temp_dir_t &) = delete;
    temp_dir_t &
    operator=(const temp_dir_t &) = delete;

    /**
     * Creates a fresh directory inside \p parent, or inside $TMPDIR (else
     * /tmp) when \p parent is empty.  Returns "" on success.
     */
    std::string
    create(const std::string &parent);

    /**
     * Removes the directory and its contents.  Returns "" on success,
     * including when there was nothing to remove.
     */
    std::string
    remove();

    const std::string &
    get_path() const
    {
        return path_;
    }

private:
    unsigned int verbosity_;
    std::string path_;
};

} // namespace fibertrace

#endif /* _TEMP_DIR_H_ */
