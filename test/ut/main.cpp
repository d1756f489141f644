//=============================================================================
// isobox Unit Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>

int main() {
    // Suites in test/ut/isobox/ register themselves at static init
}
