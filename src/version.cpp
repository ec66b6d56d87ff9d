#include "version.h"
#include <iostream>

namespace blockshare {
namespace version {

void print_version_info() {
    std::cout << "blockshare " << STRING;
    if (BUILD[0] != '\0') {
        std::cout << " (" << BUILD << ")";
    }
    std::cout << std::endl;
}

} // namespace version
} // namespace blockshare
