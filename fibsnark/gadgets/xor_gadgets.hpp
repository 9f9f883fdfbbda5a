/** @file
 *****************************************************************************

 Declaration of interfaces for xor gadgets

 word_unpack_gadget: decomposes a value into word_bits boolean bits. The
 packing constraint doubles as a range check 0 <= value < 2^word_bits.

 xor_gadget: bitwise xor of two words given by their bits, the result is
 packed into a single variable
 *****************************************************************************/

#ifndef XOR_GADGETS_H
#define XOR_GADGETS_H

#include <memory>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"

template<typename FieldT>
class word_unpack_gadget : public libsnark::gadget<FieldT> {
private:
    std::shared_ptr<libsnark::packing_gadget<FieldT> > pack_value;

public:
    libsnark::pb_variable_array<FieldT> bits;
    const size_t word_bits;
    const libsnark::pb_linear_combination<FieldT> value;

    word_unpack_gadget(libsnark::protoboard<FieldT>& pb,
                       const size_t word_bits,
                       const libsnark::pb_linear_combination<FieldT> &value,
                       const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), word_bits(word_bits), value(value)
    {
        assert(word_bits > 0);
        assert(word_bits < FieldT::capacity());
        bits.allocate(pb, word_bits, FMT(this->annotation_prefix, ".bits"));

        pack_value.reset(new libsnark::packing_gadget<FieldT>(pb, bits, value,
                                                       FMT(this->annotation_prefix, ".pack_value")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class xor_gadget : public libsnark::gadget<FieldT> {
/**
 * For boolean a, b:  a xor b = a + b - 2ab
 *
 * Constraints
 * (1) (2 a_i) * b_i = a_i + b_i - r_i   for every bit i
 * (2) result = sum 2^i r_i
 *
 * a and b have to be boolean constrained by the caller, r is then
 * boolean as well.
 */
private:
    libsnark::pb_variable_array<FieldT> result_bits;
    std::shared_ptr<libsnark::packing_gadget<FieldT> > pack_result;

public:
    const libsnark::pb_variable_array<FieldT> a;
    const libsnark::pb_variable_array<FieldT> b;
    const libsnark::pb_variable<FieldT> result;

    xor_gadget(libsnark::protoboard<FieldT>& pb,
               const libsnark::pb_variable_array<FieldT> &a,
               const libsnark::pb_variable_array<FieldT> &b,
               const libsnark::pb_variable<FieldT> &result,
               const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), a(a), b(b), result(result)
    {
        assert(a.size() == b.size());
        result_bits.allocate(pb, a.size(), FMT(this->annotation_prefix, ".result_bits"));

        pack_result.reset(new libsnark::packing_gadget<FieldT>(pb, result_bits, result,
                                                        FMT(this->annotation_prefix, ".pack_result")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};


#include "xor_gadgets.tcc"
#endif //XOR_GADGETS_H
