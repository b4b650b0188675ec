#ifndef UTILS_H
#define UTILS_H

#include <iostream>
#include <string>

const std::string BOLD = "\033[1m";
const std::string RESET = "\033[0m";

std::string bold(const std::string& text);
void printUsage(std::ostream& out = std::cout);

#endif
