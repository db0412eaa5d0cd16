#pragma once
#include <iostream>
#include <string>

struct TestSuite {
    bool ok = true;
    void require(bool condition, const std::string& message) {
        if (!condition) {
            std::cerr << "[FAIL] " << message << std::endl;
            ok = false;
        }
    }

    int finish(const std::string& name) const {
        if (!ok) {
            std::cerr << name << " tests FAILED" << std::endl;
            return 1;
        }
        std::cout << name << " tests passed" << std::endl;
        return 0;
    }
};
