#pragma once

#include "CongestionModel.h"

#include <vector>

namespace taxisim {

// Places num_drivers one at a time, each into the zone with the largest
// marginal gain under the congestion model. Ties go to the lowest zone index.
//
// Post: result.size() == revenues.size(), sum(result) == num_drivers.
// num_drivers == 0 yields all zeros. Throws std::invalid_argument for a
// negative driver count, an empty revenue vector with drivers to place, or
// bad model parameters.
std::vector<int> allocateGreedy(int num_drivers,
                                const std::vector<double>& revenues,
                                CongestionModel model,
                                double alpha);

} // namespace taxisim
