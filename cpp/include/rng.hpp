#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace sugarscape {

class PCG64 {
public:
    explicit PCG64(uint64_t seed);
    PCG64(uint64_t seed, uint64_t stream);

    uint64_t next();
    double uniform();
    double uniform(double low, double high);
    int integers(int low, int high);
    bool coin();

    // Fisher-Yates, every permutation equally likely
    template <typename T>
    void shuffle(std::vector<T>& items) {
        for (int i = static_cast<int>(items.size()) - 1; i > 0; i--) {
            int j = integers(0, i + 1);
            if (i != j) {
                using std::swap;
                swap(items[i], items[j]);
            }
        }
    }

    PCG64 spawn();

private:
    uint64_t state_;
    uint64_t inc_;

    static constexpr uint64_t MULTIPLIER = 6364136223846793005ULL;
};

}  // namespace sugarscape
