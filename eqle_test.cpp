#include <iostream>
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "self_test.hpp"

using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;

int main() {
    ptime start = microsec_clock::local_time();
    try {
        run_all_tests();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "All tests passed, took "
              << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << std::endl;
    return 0;
}
