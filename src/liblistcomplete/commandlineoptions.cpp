
#include <getopt.h>
#include <iostream>
#include <sstream>
#include <vector>

#include "tools/string_helpers.h"

#include "commandlineoptions.h"


CommandLineOptions::~CommandLineOptions()
{
}

bool CommandLineOptions::parse(const std::vector<std::string>& args)
{
    bool ret = true;
    int option_index = 0;

    // getopt permutes argv, work on a copy
    std::vector<std::vector<char>> storage;
    for (const auto& a : args)
        storage.emplace_back(a.c_str(), a.c_str() + a.size() + 1);
    std::vector<char*> v;
    for (auto& s : storage)
        v.emplace_back(s.data());
    v.emplace_back(nullptr);

    using std::endl;
    std::string app_name = args.empty() ? "listcomplete-demo" : args[0];
    std::stringstream usage;
    usage << "Usage: " << app_name << " [options]" << endl
          << "" << endl
          << "Options:" << endl
          << " -h, --help            show this help message and exit" << endl
          << "" << endl
          << "  General Options:" << endl
          << "    -s SEP, --separator=SEP" << endl
          << "                        List separator character, empty for single" << endl
          << "                        value mode" << endl
          << "    -t N, --threshold=N Minimum number of typed characters before" << endl
          << "                        suggestions are looked up" << endl
          << "    -w FILE, --word-list=FILE" << endl
          << "                        Suggestions, one per line" << endl
          << "" << endl
          << "  Debug Options:" << endl
          << "    -d LEVEL, --debug=LEVEL" << endl
          << "                        Set logging level" << endl
          << "                        LEVEL={all|event|trace|debug|info|warning|error|" << endl
          << "                        critical}" << endl
          ;

    // ":" = required argument
    const char* short_options = "hd:s:t:w:";

    static struct option long_options[] = {
        {"help",  no_argument, 0, 'h'},
        {"debug",  required_argument, 0, 'd'},
        {"separator",  required_argument, 0, 's'},
        {"threshold",  required_argument, 0, 't'},
        {"word-list",  required_argument, 0, 'w'},
        {0, 0, 0, 0},
    };

    optind = 0;  // full reset, parse() may run more than once
    while (true)
    {
        int opt = getopt_long (static_cast<int>(storage.size()),
                               v.data(),
                               short_options, long_options, &option_index);

        if (opt == -1) // no more options?
            break;

        switch (opt)
        {
            case 'd':
                this->log_level = optarg;
                break;

            case 's':
                this->separator = optarg;
                break;

            case 't':
            {
                int value;
                if (try_to_int(optarg, value))
                {
                    this->threshold = value;
                }
                else
                {
                    std::cerr << app_name << ": invalid threshold "
                              << repr(std::string(optarg)) << endl;
                    ret = false;
                }
                break;
            }

            case 'w':
                this->word_file = optarg;
                break;

            case 'h':
            case '?':
                std::cout << usage.str();
                ret = false;
                break;

            default:
                ret = false;
                break;
        }
    }

    for (size_t i = static_cast<size_t>(optind); i < storage.size(); i++)
        this->remaining_args.emplace_back(v[i]);

    return ret;
}
