// src/main.cpp
//
// Console entry point: parse argv and hand over to lore::app::AppMain.

#include "app/App.h"
#include "app/CommandLineArgs.h"

#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    const lore::app::CommandLineArgs args = lore::app::ParseCommandLineArgs(argc, argv);

    try
    {
        return lore::app::AppMain(args, std::cin, std::cout, std::cerr);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
}
