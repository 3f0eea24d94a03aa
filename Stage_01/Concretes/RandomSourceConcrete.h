// RandomSourceConcrete.h
#pragma once

#include <cstdint>
#include <random>

#include "../Interfaces/IRandomSource.h"

namespace baseload {

/**
 * @class RandomSourceConcrete
 * @brief Mersenne-Twister backed uniform source. Seed 0 draws a seed from std::random_device.
 *
 * Not thread-safe; only the control loop draws from it.
 */
class RandomSourceConcrete : public IRandomSource {
public:
    explicit RandomSourceConcrete(uint64_t seed = 0)
        : engine_(seed != 0 ? seed : std::random_device{}()), dist_(0.0, 1.0) {}

    double uniform() override { return dist_(engine_); }

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_;
};

} // namespace baseload
