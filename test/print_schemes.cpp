#include <iostream>

#include <constraints/constraints.hpp>
#include <constraints/scheme.hpp>

int main() {
    const int sizes[] = {0, 8190, 8191, 32766, 32767, 65534, 65535, 262142};
    for (auto w : sizes) {
        auto c = pconstraints::make(0, w, 0, 100);
        std::cout << c << " scheme: " << pconstraints::to_string(c.focus())
                  << " word: " << std::hex << c.value() << std::dec << "\n";
    }
    return 0;
}
