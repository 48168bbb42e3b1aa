#pragma once
#include <string>
#include <random>
#include <sstream>

namespace toolgate::core::config {

    // Generates a random hex ID with the given prefix, e.g. "srv-3fa91c07be12".
    inline std::string generate_id(const std::string& prefix, int hex_digits = 12) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < hex_digits; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_server_id() {
        return generate_id("srv-");
    }

} // namespace toolgate::core::config
