/** @file
 *****************************************************************************

 Native evaluation of the recurrences proved by the circuits.

 Each function returns the terms t[0] .. t[steps]. A term that does not fit
 in 64 bits raises std::overflow_error, steps below the first computed index
 raise std::invalid_argument.

 *****************************************************************************/

#ifndef RECURRENCES_H
#define RECURRENCES_H

#include <cstddef>
#include <cstdint>
#include <vector>

// t[i] = t[i-1] + t[i-2], steps >= 2
std::vector<uint64_t> fibonacci_sequence(uint64_t f0, uint64_t f1, size_t steps);

// t[i] = t[i-3] + (t[i-2] ^ t[i-1]), steps >= 3
std::vector<uint64_t> xor_fibonacci_sequence(uint64_t f0, uint64_t f1, uint64_t f2, size_t steps);

// t[k] = t[k-2] + t[k-1] for even k, t[k-2] ^ t[k-1] for odd k, steps >= 2
std::vector<uint64_t> alternating_fibonacci_sequence(uint64_t f0, uint64_t f1, size_t steps);

bool fits_word(uint64_t value, size_t word_bits);

#endif //RECURRENCES_H
