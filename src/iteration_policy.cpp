#include "iteration_policy.hpp"

namespace {

struct CapStep {
    const char* below;
    int         cap;
};

const CapStep kSteps[] = {
    {"1e1",  512},
    {"1e2",  1024},
    {"1e3",  2048},
    {"1e4",  4096},
    {"1e5",  8192},
    {"1e12", 16384},
    {"1e15", 32768},
    {"1e18", 65536},
    {"1e21", 131072},
    {"1e24", 262144},
    {"1e27", 524288},
    {"1e30", 1048576},
};

constexpr int kDeepestCap = 2097152;

} // namespace

int cap_for(const Decimal& zoom)
{
    if (boost::multiprecision::isnan(zoom)) return kSteps[0].cap;

    static const Decimal thresholds[] = {
        Decimal(kSteps[0].below),  Decimal(kSteps[1].below),
        Decimal(kSteps[2].below),  Decimal(kSteps[3].below),
        Decimal(kSteps[4].below),  Decimal(kSteps[5].below),
        Decimal(kSteps[6].below),  Decimal(kSteps[7].below),
        Decimal(kSteps[8].below),  Decimal(kSteps[9].below),
        Decimal(kSteps[10].below), Decimal(kSteps[11].below),
    };

    for (size_t i = 0; i < sizeof(kSteps) / sizeof(kSteps[0]); ++i)
        if (zoom < thresholds[i]) return kSteps[i].cap;
    return kDeepestCap;
}
