#include "word_capitalizer.h"

using namespace std;

vector<string> CapitalizeWords(const vector<Item>& items, 
                               ostream& log) {
    return CapitalizeWords(items, 
                           [&log]() { log << kSkipNotice << endl; });
}
