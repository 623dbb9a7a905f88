#include "CongestionModel.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace taxisim {

namespace {

std::string toLowerTrimmed(const std::string& v) {
    std::size_t b = 0;
    std::size_t e = v.size();
    while (b < e && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
    std::string out = v.substr(b, e - b);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

CongestionModel parseCongestionModel(const std::string& name) {
    const std::string n = toLowerTrimmed(name);
    if (n == "saturation") return CongestionModel::Saturation;
    if (n == "split") return CongestionModel::Split;
    throw std::invalid_argument("unknown congestion model: '" + name + "'");
}

const char* congestionModelName(CongestionModel model) {
    switch (model) {
        case CongestionModel::Saturation: return "saturation";
        case CongestionModel::Split:      return "split";
    }
    return "unknown";
}

void validateCongestionParams(CongestionModel model, double alpha) {
    if (model == CongestionModel::Saturation && !(std::isfinite(alpha) && alpha > 0.0)) {
        std::ostringstream oss;
        oss << "saturation model requires alpha > 0 (got " << alpha << ")";
        throw std::invalid_argument(oss.str());
    }
}

double realizedRevenue(CongestionModel model, int n, double revenue, double alpha) {
    if (n <= 0) return 0.0;
    if (!std::isfinite(revenue) || revenue <= 0.0) return 0.0;

    switch (model) {
        case CongestionModel::Saturation:
            return revenue * (1.0 - std::exp(-alpha * static_cast<double>(n)));
        case CongestionModel::Split:
            return revenue;
    }
    return 0.0;
}

double marginalGain(CongestionModel model, int n, double revenue, double alpha) {
    return realizedRevenue(model, n + 1, revenue, alpha) - realizedRevenue(model, n, revenue, alpha);
}

double computeMacro(const std::vector<int>& counts,
                    const std::vector<double>& revenues,
                    CongestionModel model,
                    double alpha) {
    if (counts.size() != revenues.size()) {
        std::ostringstream oss;
        oss << "zone count mismatch: " << counts.size() << " counts vs "
            << revenues.size() << " revenues";
        throw std::invalid_argument(oss.str());
    }
    validateCongestionParams(model, alpha);

    double total = 0.0;
    for (std::size_t k = 0; k < counts.size(); ++k) {
        if (counts[k] < 0) {
            throw std::invalid_argument("negative driver count in zone " + std::to_string(k));
        }
        total += realizedRevenue(model, counts[k], revenues[k], alpha);
    }
    return total;
}

std::vector<int> zoneCounts(const std::vector<int>& zones, int num_zones) {
    if (num_zones < 0) {
        throw std::invalid_argument("num_zones must be non-negative");
    }
    std::vector<int> counts(static_cast<std::size_t>(num_zones), 0);
    for (int z : zones) {
        if (z < 0 || z >= num_zones) {
            throw std::invalid_argument("zone id " + std::to_string(z) + " outside [0, " +
                                        std::to_string(num_zones) + ")");
        }
        ++counts[static_cast<std::size_t>(z)];
    }
    return counts;
}

} // namespace taxisim
