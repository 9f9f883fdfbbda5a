/** @file
 *****************************************************************************

 interfaces for utilities for using gadgets.

 Conversions between unsigned machine words and field elements.

 *****************************************************************************/


#ifndef GADGET_UTILS_H
#define GADGET_UTILS_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <gmpxx.h>

#include <libff/common/utils.hpp>
#include <libff/algebra/field_utils/bigint.hpp>

int num_bits(uint64_t value);


// Fp_model(long) wraps negative values, so the word is passed as unsigned
template<typename FieldT>
FieldT field_from_ulong(uint64_t v){
    return FieldT(static_cast<long>(v), true);
}

template<typename FieldT>
bool field_fits_ulong(const FieldT &v){
    return v.as_bigint().num_bits() <= 64;
}

template<typename FieldT>
uint64_t field_to_ulong(const FieldT &v){
    if (!field_fits_ulong(v)){
        throw std::overflow_error("field element does not fit in 64 bits");
    }
    return v.as_ulong();
}

template<typename FieldT>
std::string field_to_string(const FieldT &v){
    if (field_fits_ulong(v)){
        return std::to_string(v.as_ulong());
    }
    // bigint streaming is binary with BINARY_OUTPUT, go through gmp instead
    mpz_t t;
    mpz_init(t);
    v.as_bigint().to_mpz(t);
    const mpz_class value(t);
    mpz_clear(t);
    return value.get_str(10);
}

#endif //GADGET_UTILS_H
