/**
 * @file main.cpp
 * @brief main関数
 * @author sawada
 * @date 2026-10-19
 */

#include <iostream>
#include <string>

#include "app/run_app.hpp"

constexpr const char* CONFIG_FILE = "./config/config.yaml";

int main(int argc, char* argv[])
{
    const std::string config_file = (argc > 1) ? argv[1] : CONFIG_FILE;

    return run_app(config_file, std::cout);
}
