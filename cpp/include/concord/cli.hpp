#pragma once

namespace concord::cli
{
    /** Entry point for the concord command line. Returns the process exit code. */
    int run(int argc, char *argv[]);
}
