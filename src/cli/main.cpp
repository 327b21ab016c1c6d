//! # sidl-traits Entry Point
//!
//! All work happens in `sidl_main()` (`cli/driver.cpp`).

#include "driver.hpp"

int main(int argc, char* argv[]) {
    return sidl_main(argc, argv);
}
