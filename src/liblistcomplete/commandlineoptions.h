#ifndef COMMANDLINEOPTIONS_H
#define COMMANDLINEOPTIONS_H

#include <optional>
#include <string>
#include <vector>


class CommandLineOptions
{
    public:
        ~CommandLineOptions();

        // Returns false on errors or if help was requested,
        // usage went to std::cout then.
        bool parse(const std::vector<std::string>& args);

    public:
        std::optional<std::string> log_level;
        std::optional<std::string> separator;
        std::optional<int> threshold;
        std::string word_file;

        std::vector<std::string> remaining_args;
};

#endif // COMMANDLINEOPTIONS_H
