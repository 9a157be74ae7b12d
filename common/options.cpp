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
/* shared options for the frontend and the documentation */

#include "options.h"

#include <string>

#include "ftoption.h"

namespace fibertrace {

using ::fibertrace::ftoption::ftoption_t;

ftoption_t<std::string> op_outfile(
    "outfile", "", "Path of the trace file to write",
    "Specifies the path of the Fuchsia trace format file to write.  A \".gz\" suffix "
    "selects gzip compression and a \".lz4\" suffix selects lz4 frame compression, "
    "where the build supports them.  If unset, the trace is written to \"" DEFAULT_TRACE_FILE
    "\" in the current directory, unless -ui is given, in which "
    "case it is written inside the temporary directory and removed once the viewer "
    "exits.");

ftoption_t<double> op_freq("freq", 100., 0.1, 10000., "Poll frequency in Hz",
                           "How many times per second the event buffers of the "
                           "child process are read while it runs.  Higher values "
                           "lower the chance of the child overwriting events before "
                           "they are read, at the cost of more recorder wakeups.");

ftoption_t<std::string> op_ui(
    "ui", "", "Viewer command to launch on the trace",
    "If set, this command is run with the trace file path as its single argument "
    "once recording has finished, or after one second, whichever comes first.  "
    "The recorder waits for the viewer to exit before cleaning up.");

ftoption_t<std::string> op_tmpdir(
    "tmpdir", "", "Parent of the temporary event directory",
    "The child writes its event buffers into a fresh temporary directory created "
    "under this path.  Defaults to $TMPDIR, or /tmp if that is unset.  The directory "
    "is removed when recording ends, whether it succeeds or fails.");

ftoption_t<unsigned int> op_verbose("verbose", 0, 0, 64, "Verbosity level",
                                    "Verbosity level for notifications.");

} // namespace fibertrace
