#ifndef SOCKCAN_TEST_UTIL_HPP
#define SOCKCAN_TEST_UTIL_HPP

#include <cstdlib>
#include <iostream>
#include <string_view>

#include "SockCAN/Util/Error.hpp"

namespace SockCAN::Test
{
    // exit code ctest reports as skipped
    constexpr int SKIPPED = 77;

    inline int failures = 0;

    inline void check(const bool ok, const std::string_view what)
    {
        if (ok)
        {
            std::cout << "PASS: " << what << std::endl;
        }
        else
        {
            std::cerr << "FAIL: " << what << std::endl;
            ++failures;
        }
    }

    template <typename Expected>
    bool fails_with(const Expected& result, const ErrorCode code)
    {
        return !result && result.error().code == code;
    }

    inline int finish(const std::string_view suite)
    {
        std::cout << "\n--- SockCAN " << suite << " Test Finished, " << failures << " failure(s) ---" << std::endl;
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }
}

#endif //SOCKCAN_TEST_UTIL_HPP
