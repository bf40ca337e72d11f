#pragma once

#include <iostream>
#include <vector>

#include "word_capitalizer.h"

std::vector<Item> MakeDemoItems();

// Capitalizes the demo items, writing skip notices and then the word list to output.
void RunDemo(std::ostream& output = std::cout);
