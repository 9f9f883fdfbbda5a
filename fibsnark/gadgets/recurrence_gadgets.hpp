/** @file
 *****************************************************************************

 Declaration of interfaces for xor recurrence gadgets

 xor_fibonacci_gadget: t[i] = t[i-3] + (t[i-2] xor t[i-1]), starting from
 three initial terms

 alternating_fibonacci_gadget: t[k] = t[k-2] + t[k-1] for even k and
 t[k] = t[k-2] xor t[k-1] for odd k, starting from two initial terms

 Every term used as an xor operand is unpacked exactly once, so it is range
 checked to word_bits bits and its bits are shared by all xors reading it.
 *****************************************************************************/

#ifndef RECURRENCE_GADGETS_H
#define RECURRENCE_GADGETS_H

#include <memory>
#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "fibsnark/gadgets/xor_gadgets.hpp"

template<typename FieldT>
class xor_fibonacci_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable_array<FieldT> intermediate;
    libsnark::pb_variable_array<FieldT> xored;
    // unpack[j] decomposes t[j], j = 1 .. steps-1
    std::vector<std::shared_ptr<word_unpack_gadget<FieldT>>> unpack;
    // xors[i-3] computes t[i-2] xor t[i-1]
    std::vector<std::shared_ptr<xor_gadget<FieldT>>> xors;

public:
    // t[0] .. t[steps], t[0..2] are the initial terms, t[steps] is out
    libsnark::pb_variable_array<FieldT> terms;

    const size_t steps;
    const size_t word_bits;
    const libsnark::pb_variable_array<FieldT> initial;
    const libsnark::pb_variable<FieldT> out;

    xor_fibonacci_gadget(libsnark::protoboard<FieldT>& pb,
                         const size_t steps,
                         const size_t word_bits,
                         const libsnark::pb_variable_array<FieldT> &initial,
                         const libsnark::pb_variable<FieldT> &out,
                         const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), steps(steps), word_bits(word_bits), initial(initial), out(out)
    {
        assert(steps >= 3);
        assert(initial.size() == 3);

        intermediate.allocate(pb, steps - 3, FMT(this->annotation_prefix, ".t"));
        terms.insert(terms.end(), initial.begin(), initial.end());
        terms.insert(terms.end(), intermediate.begin(), intermediate.end());
        terms.emplace_back(out);

        unpack.resize(steps);
        for (size_t j = 1; j < steps; ++j){
            unpack[j].reset(new word_unpack_gadget<FieldT>(pb, word_bits, terms[j],
                    FMT(this->annotation_prefix, ".unpack_%zu", j)));
        }

        xored.allocate(pb, steps - 2, FMT(this->annotation_prefix, ".xor"));
        for (size_t i = 3; i <= steps; ++i){
            xors.emplace_back(new xor_gadget<FieldT>(pb, unpack[i-2]->bits, unpack[i-1]->bits, xored[i-3],
                    FMT(this->annotation_prefix, ".xor_%zu", i)));
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class alternating_fibonacci_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable_array<FieldT> intermediate;
    // null where t[j] is never an xor operand
    std::vector<std::shared_ptr<word_unpack_gadget<FieldT>>> unpack;
    // xors[k] is set for odd k
    std::vector<std::shared_ptr<xor_gadget<FieldT>>> xors;

public:
    libsnark::pb_variable_array<FieldT> terms;

    const size_t steps;
    const size_t word_bits;
    const libsnark::pb_variable<FieldT> f0;
    const libsnark::pb_variable<FieldT> f1;
    const libsnark::pb_variable<FieldT> out;

    alternating_fibonacci_gadget(libsnark::protoboard<FieldT>& pb,
                                 const size_t steps,
                                 const size_t word_bits,
                                 const libsnark::pb_variable<FieldT> &f0,
                                 const libsnark::pb_variable<FieldT> &f1,
                                 const libsnark::pb_variable<FieldT> &out,
                                 const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), steps(steps), word_bits(word_bits), f0(f0), f1(f1), out(out)
    {
        assert(steps >= 2);

        intermediate.allocate(pb, steps - 2, FMT(this->annotation_prefix, ".t"));
        terms.emplace_back(f0);
        terms.emplace_back(f1);
        terms.insert(terms.end(), intermediate.begin(), intermediate.end());
        terms.emplace_back(out);

        unpack.resize(steps + 1);
        xors.resize(steps + 1);
        for (size_t k = 3; k <= steps; k += 2){
            for (size_t j = k - 2; j < k; ++j){
                if (!unpack[j]){
                    unpack[j].reset(new word_unpack_gadget<FieldT>(pb, word_bits, terms[j],
                            FMT(this->annotation_prefix, ".unpack_%zu", j)));
                }
            }
            xors[k].reset(new xor_gadget<FieldT>(pb, unpack[k-2]->bits, unpack[k-1]->bits, terms[k],
                    FMT(this->annotation_prefix, ".xor_%zu", k)));
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};


#include "recurrence_gadgets.tcc"
#endif //RECURRENCE_GADGETS_H
