#pragma once

#include "Types.hpp"

/**
 * @brief Price source consumed once per step.
 */
class Oracle {
public:
    virtual ~Oracle() = default;

    /**
     * @return The price and whether the oracle considers it trustworthy.
     * An invalid reading is not an error: the regulator treats it as peg.
     */
    virtual OracleReading capture() = 0;
};
