#include "app/App.h"

#include <iostream>

int main(int argc, char** argv)
{
    const maze::app::CommandLineArgs args = maze::app::ParseCommandLineArgs(argc, argv);
    return maze::app::RunApp(args, std::cout);
}
