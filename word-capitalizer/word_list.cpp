#include <sstream>

#include "word_list.h"

using namespace std;

string FormatWords(const vector<string>& words) {
    ostringstream output;
    output << '[';
    bool is_first = true;
    for (const auto& word : words) {
        if (!is_first) {
            output << kWordListSeparator;
        }
        output << word;
        is_first = false;
    }
    output << ']';
    return output.str();
}

void PrintWords(const vector<string>& words, 
                ostream& output) {
    output << FormatWords(words) << endl;
}
