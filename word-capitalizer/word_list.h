#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace std::literals;

constexpr std::string_view kWordListSeparator = ", "sv;

// {"Hello", "World"} -> "[Hello, World]"
std::string FormatWords(const std::vector<std::string>& words);

void PrintWords(const std::vector<std::string>& words, 
                std::ostream& output = std::cout);
