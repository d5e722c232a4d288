/*
seaecho - Acoustic target strength of gas bubbles and solid spheres in seawater
Copyright (C) 2021-2023 The Regents of the University of California
Marine Physical Lab at Scripps Oceanography, c/o Jules Jaffe, jjaffe@ucsd.edu

This program is free software: you can redistribute it and/or modify it under
the terms of the GNU General Public License as published by the Free Software
Foundation, either version 3 of the License, or (at your option) any later
version.

This program is distributed in the hope that it will be useful, but WITHOUT ANY
WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
PARTICULAR PURPOSE. See the GNU General Public License for more details.

You should have received a copy of the GNU General Public License along with
this program. If not, see <https://www.gnu.org/licenses/>.
*/
#include "common_setup.hpp"

static seaecho::seInit init;

int mainmain()
{
    seaecho::seParams params;
    seaecho::seOutputs outputs;
    int ret = 1;
    if(seaecho::setup(init, params, outputs) && seaecho::run(params, outputs)
       && seaecho::writeout(params, outputs, nullptr)) {
        ret = 0;
    }
    seaecho::finalize(params, outputs);
    return ret;
}

void showhelp(const char *argv0)
{
    std::cout
        << SEAECHO_PROGRAMNAME
        " - Acoustic target strength of gas bubbles and solid spheres in seawater\n"
        "\n"
        "Copyright (C) 2021-2023 The Regents of the University of California\n"
        "Marine Physical Lab at Scripps Oceanography, c/o Jules Jaffe, jjaffe@ucsd.edu\n"
        "GPL3 licensed, no warranty, see LICENSE or https://www.gnu.org/licenses/\n"
        "\n"
        "Usage: "
        << argv0
        << " [options] FileRoot\n"
           "FileRoot is the absolute or relative path to the environment file, minus "
           "the\n"
           ".env file extension, e.g. examples/bubble2mm . The print file and the\n"
           "results are written to FileRoot.prt and FileRoot.csv.\n"
           "All command-line options may be specified with one or two dashes, e.g.\n"
           "-1 or --1 do the same thing. Furthermore, all command-line options have\n"
           "multiple synonyms which do the same thing.\n"
           "\n"
           "-?, -h, -help: Shows this help message\n"
           "-1, -singlethread: Use only one worker thread\n"
           "-mem=X, -memory=X: Sets the amount of memory " SEAECHO_PROGRAMNAME
           " should use.\n"
           "    X may have a wide range of suffixes, examples: 16GiB, 8M, 100000kB\n"
           "    non-examples: 4gI, 2m, 5.3G. Default: 4GiB\n";
}

int main(int argc, char **argv)
{
    std::string FileRoot;
    for(int32_t i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if(argv[i][0] == '-') {
            if(s.length() >= 2 && argv[i][1] == '-') { // two dashes
                s = s.substr(1);
            }
            if(s == "-1" || s == "-singlethread") {
                init.numThreads = 1;
            } else if(s == "-?" || s == "-h" || s == "-help") {
                showhelp(argv[0]);
                return 0;
            } else {
                size_t equalspos = s.find("=");
                if(equalspos == std::string::npos) {
                    std::cout << "Unknown command-line option \"" << s << "\", try "
                              << argv[0] << " --help\n";
                    return 1;
                }
                std::string key   = s.substr(0, equalspos);
                std::string value = s.substr(equalspos + 1);
                if(key == "-mem" || key == "-memory") {
                    size_t multiplier = 1u;
                    size_t base       = 1000u;
                    if(seaecho::endswith(value, "B") || seaecho::endswith(value, "b")) {
                        value = value.substr(0, value.length() - 1);
                    }
                    if(seaecho::endswith(value, "i")) {
                        base  = 1024u;
                        value = value.substr(0, value.length() - 1);
                    }
                    if(seaecho::endswith(value, "k") || seaecho::endswith(value, "K")) {
                        multiplier = base;
                        value      = value.substr(0, value.length() - 1);
                    } else if(seaecho::endswith(value, "M")) {
                        multiplier = base * base;
                        value      = value.substr(0, value.length() - 1);
                    } else if(seaecho::endswith(value, "G")) {
                        multiplier = base * base * base;
                        value      = value.substr(0, value.length() - 1);
                    }
                    if(!seaecho::isInt(value, false)
                       || (base == 1024u && multiplier == 1u)) {
                        std::cout << "Value \"" << value
                                  << "\" for --memory argument is invalid, try "
                                  << argv[0] << " --help\n";
                        return 1;
                    }
                    init.maxMemory = multiplier * std::stoull(value);
                } else {
                    std::cout << "Unknown command-line option \"-" << key << "=" << value
                              << "\", try " << argv[0] << " --help\n";
                    return 1;
                }
            }
        } else {
            if(FileRoot.empty()) {
                FileRoot = s;
            } else {
                std::cout << "Interpreting both \"" << FileRoot << "\" and \"" << s
                          << "\" as FileRoot, error\n";
                return 1;
            }
        }
    }
    if(FileRoot.empty()) {
        std::cout << "Must provide FileRoot as command-line parameter, try " << argv[0]
                  << " --help\n";
        return 1;
    }
    init.FileRoot = FileRoot.c_str();

    return mainmain();
}
