// SPDX-License-Identifier: Apache-2.0
// e2e_cli_exit_codes.cpp
// Runs the built urlprm binary and checks its exit status for each outcome.
// usage: e2e_cli_exit_codes <path/to/urlprm> <path/to/config.yaml>
#include <sys/wait.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

static std::string g_tool;
static std::string g_config;

static int run(const std::string &args)
{
    std::string cmd = "'" + g_tool + "' " + args + " >/dev/null 2>&1";
    int status = std::system(cmd.c_str());
    assert(status != -1);
    assert(WIFEXITED(status));
    return WEXITSTATUS(status);
}

int main(int argc, char **argv)
{
    if (argc < 3) {
        std::cerr << "usage: e2e_cli_exit_codes <urlprm> <config.yaml>\n";
        return 2;
    }
    g_tool = argv[1];
    g_config = argv[2];
    const std::string cfg = "'" + g_config + "' ";

    // success
    assert(run("--help") == 0);
    assert(run(cfg + "encode r=2.5 o=0.5") == 0);
    assert(run(cfg + "encode c=1.5,-0.75 s=0.1,0.2") == 0);
    assert(run(cfg + "decode 'r=syAA&o=zzz'") == 0);
    assert(run(cfg + "decode") == 0);

    // configuration failure, unknown key or command, bad value
    assert(run("'" + g_config + ".missing.yaml' decode") == 1);
    assert(run(cfg + "bogus") == 1);
    assert(run(cfg + "encode nokey=1") == 1);
    assert(run(cfg + "encode r=abc") == 1);
    assert(run(cfg + "encode r=1e300") == 1);

    // usage errors
    assert(run(cfg) == 2);
    assert(run(cfg + "encode r") == 2);

    std::cout << "e2e_cli_exit_codes OK" << std::endl;
    return 0;
}
