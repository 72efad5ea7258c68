#pragma once
#include <random>
#include <sstream>
#include <string>

namespace openfang::core {

// "run-" followed by 16 random hex digits
inline std::string generate_run_id() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "run-";
    for (int i = 0; i < 16; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

} // namespace openfang::core
