#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <string_view>

namespace mindgraph {

/// Generates ids of the form `<prefix><millis>_<suffix>` where millis never
/// decreases between calls and suffix is a random number in [0, 999].
///
/// Clock and random seed are injectable so tests get reproducible ids.
class IdGenerator {
public:
    /// Milliseconds since epoch
    using Clock = std::function<int64_t()>;
    /// Returns true if a candidate id is already in use
    using TakenPredicate = std::function<bool(const std::string&)>;

    IdGenerator();
    IdGenerator(Clock clock, uint32_t seed);

    /// Next id not rejected by `isTaken`
    std::string next(std::string_view prefix, const TakenPredicate& isTaken);

    /// Random integer in [0, upper]
    int randomInt(int upper);

private:
    std::string candidate(std::string_view prefix, int64_t millis);

    Clock clock_;
    std::mt19937 rng_;
    int64_t lastMillis_ = 0;
};

}  // namespace mindgraph
