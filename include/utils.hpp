#ifndef UTILS_HPP
#define UTILS_HPP

#include <iostream>
#include <cstdio>
#include <chrono>
#include <string>
#include "protocol.hpp"

// print log
void log(const char *msg);

// print error, never exits
void err(const char *msg);

// print debug info
void debug(const char *msg);

std::string get_debug_str(const char *prefix, const Packet &packet);

// byte compare two files
bool compare_files(const char *file1, const char *file2);
#endif
