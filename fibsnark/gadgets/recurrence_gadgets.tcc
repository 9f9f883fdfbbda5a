/** @file
 *****************************************************************************

 Implementation of interfaces for xor recurrence gadgets.

 See recurrence_gadgets.hpp

 *****************************************************************************/

#include "recurrence_gadgets.hpp"

template<typename FieldT>
void xor_fibonacci_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t j = 1; j < steps; ++j){
        unpack[j]->generate_r1cs_constraints();
    }

    for (size_t i = 3; i <= steps; ++i){
        xors[i-3]->generate_r1cs_constraints();
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, terms[i-3] + xored[i-3], terms[i]),
                FMT(this->annotation_prefix, ".t%zu", i));
    }
}

template<typename FieldT>
void xor_fibonacci_gadget<FieldT>::generate_r1cs_witness()
{
    unpack[1]->generate_r1cs_witness();
    unpack[2]->generate_r1cs_witness();

    for (size_t i = 3; i <= steps; ++i){
        xors[i-3]->generate_r1cs_witness();
        this->pb.val(terms[i]) = this->pb.val(terms[i-3]) + this->pb.val(xored[i-3]);
        if (i < steps){
            unpack[i]->generate_r1cs_witness();
        }
    }
}

template<typename FieldT>
void alternating_fibonacci_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t j = 0; j <= steps; ++j){
        if (unpack[j]){
            unpack[j]->generate_r1cs_constraints();
        }
    }

    for (size_t k = 2; k <= steps; ++k){
        if (k % 2 == 0){
            this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, terms[k-2] + terms[k-1], terms[k]),
                    FMT(this->annotation_prefix, ".add_%zu", k));
        }else{
            xors[k]->generate_r1cs_constraints();
        }
    }
}

template<typename FieldT>
void alternating_fibonacci_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t k = 0; k <= steps; ++k){
        if (k >= 2){
            if (k % 2 == 0){
                this->pb.val(terms[k]) = this->pb.val(terms[k-2]) + this->pb.val(terms[k-1]);
            }else{
                xors[k]->generate_r1cs_witness();
            }
        }
        if (unpack[k]){
            unpack[k]->generate_r1cs_witness();
        }
    }
}
