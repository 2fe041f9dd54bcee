#include "mindgraph/core/IdGenerator.h"

#include <algorithm>
#include <chrono>

namespace mindgraph {

namespace {
constexpr int SUFFIX_MAX = 999;
constexpr int ATTEMPTS_PER_MILLISECOND = 32;

int64_t systemMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
}  // namespace

IdGenerator::IdGenerator()
    : clock_(systemMillis), rng_(std::random_device{}()) {}

IdGenerator::IdGenerator(Clock clock, uint32_t seed)
    : clock_(std::move(clock)), rng_(seed) {}

std::string IdGenerator::next(std::string_view prefix, const TakenPredicate& isTaken) {
    lastMillis_ = std::max(lastMillis_, clock_());

    // Random suffixes first; if a millisecond is crowded, move to the next one
    while (true) {
        for (int attempt = 0; attempt < ATTEMPTS_PER_MILLISECOND; ++attempt) {
            std::string id = candidate(prefix, lastMillis_);
            if (!isTaken || !isTaken(id)) {
                return id;
            }
        }
        ++lastMillis_;
    }
}

int IdGenerator::randomInt(int upper) {
    std::uniform_int_distribution<int> dist(0, upper);
    return dist(rng_);
}

std::string IdGenerator::candidate(std::string_view prefix, int64_t millis) {
    std::string id(prefix);
    id += std::to_string(millis);
    id += '_';
    id += std::to_string(randomInt(SUFFIX_MAX));
    return id;
}

}  // namespace mindgraph
