/** @file
 *****************************************************************************

 Implementation of interfaces for xor gadgets.

 See xor_gadgets.hpp

 *****************************************************************************/

#include "xor_gadgets.hpp"

template<typename FieldT>
void word_unpack_gadget<FieldT>::generate_r1cs_constraints()
{
    pack_value->generate_r1cs_constraints(true);
}

template<typename FieldT>
void word_unpack_gadget<FieldT>::generate_r1cs_witness()
{
    // values wider than the word keep their low bits, the packing constraint fails
    value.evaluate(this->pb);
    bits.fill_with_bits_of_field_element(this->pb, this->pb.lc_val(value));
}

template<typename FieldT>
void xor_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t i = 0; i < result_bits.size(); ++i)
    {
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(2 * a[i], b[i], a[i] + b[i] - result_bits[i]),
                FMT(this->annotation_prefix, ".xor_%zu", i));
    }
    pack_result->generate_r1cs_constraints(false);
}

template<typename FieldT>
void xor_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t i = 0; i < result_bits.size(); ++i)
    {
        this->pb.val(result_bits[i]) = (this->pb.val(a[i]) == this->pb.val(b[i])) ? FieldT::zero() : FieldT::one();
    }
    pack_result->generate_r1cs_witness_from_bits();
}
