#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "core/log_history.hpp"

int main() {
    core::DedupHistory history(50, std::chrono::minutes(30));

    std::vector<std::string> messages;
    constexpr std::size_t distinct = 64;
    messages.reserve(distinct);
    for (std::size_t i = 0; i < distinct; ++i) {
        messages.push_back("connection to upstream host " + std::to_string(i) + " timed out");
    }

    constexpr std::size_t iterations = 100000;
    std::size_t accepted = 0;
    auto now = std::chrono::system_clock::now();
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        now += std::chrono::microseconds(10);
        if (history.admit(messages[i % distinct], core::Level::Warning, now)) {
            ++accepted;
        }
    }
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Admission loop " << iterations << " iterations took " << ns << " ns (" << (ns / iterations)
              << " ns/iter), accepted=" << accepted << "\n";
    return 0;
}
