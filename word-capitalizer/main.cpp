#include "demo.h"

int main() {
    RunDemo();
    return 0;
}
