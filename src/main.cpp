#include <sorted_report.h>
#include <iostream>

int main(const int argc, char* argv[]) {
    return run(argc, argv, std::cout, std::cerr);
}
