// IRandomSource.h
#pragma once

namespace baseload {

/**
 * @class IRandomSource
 * @brief Uniform random draws used by the adaptive controller and ceiling drift.
 *
 * Injectable so controller decisions can be replayed with scripted values.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Draw a value uniformly distributed in [0, 1).
     */
    virtual double uniform() = 0;
};

} // namespace baseload
