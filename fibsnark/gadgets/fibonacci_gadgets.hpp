/** @file
 *****************************************************************************

 Declaration of interfaces for fibonacci gadgets

 fibonacci_step_gadget: a single addition row, c = a + b

 fibonacci_chain_gadget: computes t[steps] from t[0], t[1] as a chain of
 step gadgets. Every step reads the outputs of the two preceding steps.

 fibonacci_sequence_gadget: computes t[steps] from t[0], t[1] on a term
 array owned by the gadget and binds the endpoints to the given variables
 *****************************************************************************/

#ifndef FIBONACCI_GADGETS_H
#define FIBONACCI_GADGETS_H

#include <memory>
#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"

template<typename FieldT>
class fibonacci_step_gadget : public libsnark::gadget<FieldT> {
    // c = a + b
public:
    const libsnark::pb_variable<FieldT> a;
    const libsnark::pb_variable<FieldT> b;
    const libsnark::pb_variable<FieldT> c;

    fibonacci_step_gadget(libsnark::protoboard<FieldT>& pb,
                          const libsnark::pb_variable<FieldT> &a,
                          const libsnark::pb_variable<FieldT> &b,
                          const libsnark::pb_variable<FieldT> &c,
                          const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), a(a), b(b), c(c)
    {}

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class fibonacci_chain_gadget : public libsnark::gadget<FieldT> {
/**
 * Row layout, one step gadget per row:
 *
 *   row k-2:  t[k-2] | t[k-1] | t[k]
 *
 * t[0] = f0, t[1] = f1, t[steps] = out. The terms t[2] .. t[steps-1] are
 * allocated here and shared between neighbouring rows.
 */
private:
    libsnark::pb_variable_array<FieldT> intermediate;
    std::vector<std::shared_ptr<fibonacci_step_gadget<FieldT>>> rows;

public:
    const size_t steps;
    const libsnark::pb_variable<FieldT> f0;
    const libsnark::pb_variable<FieldT> f1;
    const libsnark::pb_variable<FieldT> out;

    fibonacci_chain_gadget(libsnark::protoboard<FieldT>& pb,
                           const size_t steps,
                           const libsnark::pb_variable<FieldT> &f0,
                           const libsnark::pb_variable<FieldT> &f1,
                           const libsnark::pb_variable<FieldT> &out,
                           const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), steps(steps), f0(f0), f1(f1), out(out)
    {
        assert(steps >= 2);
        intermediate.allocate(pb, steps - 2, FMT(this->annotation_prefix, ".t"));

        libsnark::pb_variable<FieldT> prev_b = f0;
        libsnark::pb_variable<FieldT> prev_c = f1;
        for (size_t k = 2; k <= steps; ++k){
            const libsnark::pb_variable<FieldT> c = (k == steps) ? out : intermediate[k-2];
            rows.emplace_back(new fibonacci_step_gadget<FieldT>(pb, prev_b, prev_c, c,
                    FMT(this->annotation_prefix, ".row_%zu", k-2)));
            prev_b = prev_c;
            prev_c = c;
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    size_t num_rows() const { return rows.size(); }
};

template<typename FieldT>
class fibonacci_sequence_gadget : public libsnark::gadget<FieldT> {
/**
 * Constraints
 * (1) t[0] = f0, t[1] = f1
 * (2) t[i] = t[i-1] + t[i-2]  for 2 <= i <= steps
 * (3) t[steps] = out
 */
public:
    libsnark::pb_variable_array<FieldT> terms;

    const size_t steps;
    const libsnark::pb_variable<FieldT> f0;
    const libsnark::pb_variable<FieldT> f1;
    const libsnark::pb_variable<FieldT> out;

    fibonacci_sequence_gadget(libsnark::protoboard<FieldT>& pb,
                              const size_t steps,
                              const libsnark::pb_variable<FieldT> &f0,
                              const libsnark::pb_variable<FieldT> &f1,
                              const libsnark::pb_variable<FieldT> &out,
                              const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), steps(steps), f0(f0), f1(f1), out(out)
    {
        assert(steps >= 2);
        terms.allocate(pb, steps + 1, FMT(this->annotation_prefix, ".terms"));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};


#include "fibonacci_gadgets.tcc"
#endif //FIBONACCI_GADGETS_H
