#include "sandbox/resources.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "utils/common.hpp"

namespace runbox::sandbox {

std::int64_t ParseMemory(std::string_view value) {
    auto text = utils::ToLower(utils::Trim(value));
    if (text.empty()) {
        return kDefaultMemoryBytes;
    }

    std::int64_t multiplier = 1;
    switch (text.back()) {
        case 'g': multiplier = 1024LL * 1024 * 1024; break;
        case 'm': multiplier = 1024LL * 1024; break;
        case 'k': multiplier = 1024LL; break;
        default: break;
    }
    if (multiplier != 1) {
        text.pop_back();
    }
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return kDefaultMemoryBytes;
    }

    std::int64_t amount = 0;
    try {
        amount = std::stoll(text);
    } catch (const std::out_of_range&) {
        return kDefaultMemoryBytes;
    }
    if (amount <= 0 || amount > INT64_MAX / multiplier) {
        return kDefaultMemoryBytes;
    }
    return amount * multiplier;
}

double ParseCpu(std::string_view value) {
    const auto text = utils::Trim(value);
    if (text.empty()) {
        return kDefaultCpus;
    }
    double cpus = 0.0;
    std::size_t consumed = 0;
    try {
        cpus = std::stod(text, &consumed);
    } catch (const std::exception&) {
        return kDefaultCpus;
    }
    if (consumed != text.size() || !std::isfinite(cpus) || cpus <= 0.0) {
        return kDefaultCpus;
    }
    return cpus;
}

std::int64_t CpuNanoQuota(double cpus) {
    auto cores = static_cast<std::int64_t>(std::floor(cpus));
    if (cores < 1) {
        cores = 1;
    }
    return cores * 1'000'000'000LL;
}

}  // namespace runbox::sandbox
