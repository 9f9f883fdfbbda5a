/** @file
 *****************************************************************************

 Implementation of interfaces for fibonacci gadgets.

 See fibonacci_gadgets.hpp

 *****************************************************************************/

#include "fibonacci_gadgets.hpp"

template<typename FieldT>
void fibonacci_step_gadget<FieldT>::generate_r1cs_constraints()
{
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, a + b, c), FMT(this->annotation_prefix, ".a+b=c"));
}

template<typename FieldT>
void fibonacci_step_gadget<FieldT>::generate_r1cs_witness()
{
    this->pb.val(c) = this->pb.val(a) + this->pb.val(b);
}

template<typename FieldT>
void fibonacci_chain_gadget<FieldT>::generate_r1cs_constraints()
{
    for (auto &row : rows){
        row->generate_r1cs_constraints();
    }
}

template<typename FieldT>
void fibonacci_chain_gadget<FieldT>::generate_r1cs_witness()
{
    // rows depend on their predecessors, keep the order
    for (auto &row : rows){
        row->generate_r1cs_witness();
    }
}

template<typename FieldT>
void fibonacci_sequence_gadget<FieldT>::generate_r1cs_constraints()
{
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, terms[0], f0), FMT(this->annotation_prefix, ".t0=f0"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, terms[1], f1), FMT(this->annotation_prefix, ".t1=f1"));

    for (size_t i = 2; i <= steps; ++i){
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, terms[i-2] + terms[i-1], terms[i]),
                FMT(this->annotation_prefix, ".t%zu", i));
    }

    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, terms[steps], out), FMT(this->annotation_prefix, ".out"));
}

template<typename FieldT>
void fibonacci_sequence_gadget<FieldT>::generate_r1cs_witness()
{
    this->pb.val(terms[0]) = this->pb.val(f0);
    this->pb.val(terms[1]) = this->pb.val(f1);
    for (size_t i = 2; i <= steps; ++i){
        this->pb.val(terms[i]) = this->pb.val(terms[i-2]) + this->pb.val(terms[i-1]);
    }
    this->pb.val(out) = this->pb.val(terms[steps]);
}
