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
/* lz4_ostream_t: a wrapper around the lz4 frame API exposing the parts of the
 * std::ostream interface the trace writer uses.
 */

#ifndef _LZ4_OSTREAM_H_
#define _LZ4_OSTREAM_H_ 1

#ifndef HAS_LZ4
#    error HAS_LZ4 is required
#endif

#include <array>
#include <fstream>
#include <streambuf>
#include <string>
#include <vector>
#include <lz4frame.h>

namespace fibertrace {

class lz4_ostreambuf_t : public std::basic_streambuf<char, std::char_traits<char>> {
public:
    explicit lz4_ostreambuf_t(const std::string &path)
        : file_(path, std::ios::binary | std::ios::trunc)
    {
        if (!file_)
            return;
        auto res = LZ4F_createCompressionContext(&lzctx_, LZ4F_VERSION);
        if (LZ4F_isError(res)) {
            lzctx_ = nullptr;
            return;
        }
        dest_buf_.resize(LZ4F_compressBound(src_buf_.size(), nullptr));
        char *base = &src_buf_.front();
        setp(base, base + src_buf_.size() - 1);
        write_header();
    }

    ~lz4_ostreambuf_t() override
    {
        close();
        if (lzctx_ != nullptr)
            LZ4F_freeCompressionContext(lzctx_);
    }

    bool
    is_open() const
    {
        return lzctx_ != nullptr && !failed_;
    }

    // Compresses any pending bytes, writes the frame footer, and closes the
    // file.  Returns false if anything failed along the way.
    bool
    close()
    {
        if (closed_)
            return !failed_;
        closed_ = true;
        if (lzctx_ == nullptr)
            return false;
        sync();
        write_footer();
        file_.close();
        if (file_.fail())
            failed_ = true;
        return !failed_;
    }

private:
    int
    overflow(int extra_char) override
    {
        if (lzctx_ == nullptr || failed_)
            return traits_type::eof();

        if (extra_char != traits_type::eof()) {
            *pptr() = traits_type::to_char_type(extra_char);
            pbump(1);
        }

        int size = static_cast<int>(pptr() - pbase());
        pbump(-size);
        if (size == 0)
            return traits_type::not_eof(extra_char);
        auto ret = LZ4F_compressUpdate(lzctx_, &dest_buf_.front(), dest_buf_.size(),
                                       pbase(), size, nullptr);
        if (LZ4F_isError(ret)) {
            failed_ = true;
            return traits_type::eof();
        }
        if (!file_.write(&dest_buf_.front(), ret)) {
            failed_ = true;
            return traits_type::eof();
        }
        return traits_type::not_eof(extra_char);
    }

    int
    sync() override
    {
        return overflow(traits_type::eof()) == traits_type::eof() ? -1 : 0;
    }

    void
    write_header()
    {
        auto res =
            LZ4F_compressBegin(lzctx_, &dest_buf_.front(), dest_buf_.size(), nullptr);
        if (LZ4F_isError(res) || !file_.write(&dest_buf_.front(), res))
            failed_ = true;
    }

    void
    write_footer()
    {
        auto res =
            LZ4F_compressEnd(lzctx_, &dest_buf_.front(), dest_buf_.size(), nullptr);
        if (LZ4F_isError(res) || !file_.write(&dest_buf_.front(), res))
            failed_ = true;
    }

    static const int buffer_size_ = 1024 * 1024;
    std::ofstream file_;
    std::array<char, buffer_size_> src_buf_;
    std::vector<char> dest_buf_;
    LZ4F_compressionContext_t lzctx_ = nullptr;
    bool failed_ = false;
    bool closed_ = false;
};

class lz4_ostream_t : public std::ostream {
public:
    explicit lz4_ostream_t(const std::string &path)
        : std::ostream(new lz4_ostreambuf_t(path))
    {
        if (!static_cast<lz4_ostreambuf_t *>(rdbuf())->is_open())
            setstate(std::ios::badbit);
    }
    ~lz4_ostream_t() override
    {
        delete rdbuf();
    }
    void
    close()
    {
        if (!static_cast<lz4_ostreambuf_t *>(rdbuf())->close())
            setstate(std::ios::badbit);
    }
};

} // namespace fibertrace

#endif /* _LZ4_OSTREAM_H_ */
