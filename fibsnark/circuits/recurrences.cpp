/** @file
 *****************************************************************************

 Native evaluation of the recurrences proved by the circuits.

 *****************************************************************************/

#include "recurrences.h"
#include "fibsnark/gadgets/utils.h"

#include <limits>
#include <stdexcept>
#include <string>

namespace {

uint64_t checked_add(uint64_t a, uint64_t b, size_t index){
    if (a > std::numeric_limits<uint64_t>::max() - b){
        throw std::overflow_error("term " + std::to_string(index) + " does not fit in 64 bits");
    }
    return a + b;
}

void check_steps(size_t steps, size_t min_steps){
    if (steps < min_steps){
        throw std::invalid_argument("steps must be at least " + std::to_string(min_steps));
    }
}

}

std::vector<uint64_t> fibonacci_sequence(uint64_t f0, uint64_t f1, size_t steps){
    check_steps(steps, 2);
    std::vector<uint64_t> t = {f0, f1};
    t.reserve(steps + 1);
    for (size_t i = 2; i <= steps; ++i){
        t.emplace_back(checked_add(t[i-2], t[i-1], i));
    }
    return t;
}

std::vector<uint64_t> xor_fibonacci_sequence(uint64_t f0, uint64_t f1, uint64_t f2, size_t steps){
    check_steps(steps, 3);
    std::vector<uint64_t> t = {f0, f1, f2};
    t.reserve(steps + 1);
    for (size_t i = 3; i <= steps; ++i){
        t.emplace_back(checked_add(t[i-3], t[i-2] ^ t[i-1], i));
    }
    return t;
}

std::vector<uint64_t> alternating_fibonacci_sequence(uint64_t f0, uint64_t f1, size_t steps){
    check_steps(steps, 2);
    std::vector<uint64_t> t = {f0, f1};
    t.reserve(steps + 1);
    for (size_t k = 2; k <= steps; ++k){
        if (k % 2 == 0){
            t.emplace_back(checked_add(t[k-2], t[k-1], k));
        }else{
            t.emplace_back(t[k-2] ^ t[k-1]);
        }
    }
    return t;
}

bool fits_word(uint64_t value, size_t word_bits){
    return static_cast<size_t>(num_bits(value)) <= word_bits;
}
