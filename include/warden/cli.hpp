#pragma once

namespace warden::cli
{
    /**
     * Entry point for the warden executable. Exit codes: 0 success,
     * 1 verification failed, 2 bad arguments, 3 configuration error.
     */
    int run(int argc, char *argv[]);

} // namespace warden::cli
