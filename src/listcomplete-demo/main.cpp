#include <iostream>
#include <string>
#include <vector>

#include "demohost.h"
#include "listcompleteglobals.h"


int main (int argc, char *argv[])
{
    std::vector<std::string> args(argv, argv + argc);

    ListCompleteGlobals globals;
    DemoHost host(&globals, std::cout);
    if (!host.init(args))
        return 1;

    host.run(std::cin);

    return 0;
}
