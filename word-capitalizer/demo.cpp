#include <optional>
#include <string>

#include "demo.h"
#include "word_list.h"

using namespace std;

vector<Item> MakeDemoItems() {
    return {"hellO wOrlD"s, 
            nullopt, 
            "fRom"s, 
            nullopt, 
            "kOtlin"s, 
            ""s};
}

void RunDemo(ostream& output) {
    PrintWords(CapitalizeWords(MakeDemoItems(), output), output);
}
