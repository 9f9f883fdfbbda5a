/** @file
 *****************************************************************************

 Implementation of the protoboard setups for the recurrence examples.

 See recurrence_circuit.hpp

 *****************************************************************************/

#include <iostream>
#include <stdexcept>

#include <libff/common/profiling.hpp>

#include "recurrence_circuit.hpp"

inline void check_min_steps(const circuit_parameters &params, size_t min_steps, const char *circuit){
    if (params.steps < min_steps){
        throw std::invalid_argument(std::string(circuit) + ": steps must be at least " + std::to_string(min_steps));
    }
}

inline void check_word_bits(const circuit_parameters &params, const char *circuit){
    if (params.word_bits == 0 || params.word_bits > 64){
        throw std::invalid_argument(std::string(circuit) + ": word bits must be between 1 and 64");
    }
}

inline void check_fits_word(uint64_t value, size_t index, size_t word_bits){
    if (!fits_word(value, word_bits)){
        throw std::overflow_error("term " + std::to_string(index) + " = " + std::to_string(value)
                                  + " needs " + std::to_string(num_bits(value)) + " bits, word is "
                                  + std::to_string(word_bits) + " bits");
    }
}

template<typename FieldT>
recurrence_circuit<FieldT>::recurrence_circuit(const size_t num_initial,
                                               const circuit_parameters &params,
                                               const std::string &annotation_prefix)
        : pb(), params(params), annotation_prefix(annotation_prefix)
{
    // primary input: initial terms, then the final term
    initial.allocate(pb, num_initial, FMT(annotation_prefix, ".initial"));
    out.allocate(pb, FMT(annotation_prefix, ".out"));
}

template<typename FieldT>
void recurrence_circuit<FieldT>::finalize()
{
    pb.set_input_sizes(num_public_inputs());

    if (!libff::inhibit_profiling_info)
    {
        std::cout << annotation_prefix << ": " << pb.num_constraints() << " constraints, "
                  << pb.num_variables() << " variables, " << num_public_inputs() << " public inputs" << std::endl;
    }
}

template<typename FieldT>
void recurrence_circuit<FieldT>::generate_r1cs_witness(const std::vector<uint64_t> &values)
{
    if (values.size() != initial.size()){
        throw std::invalid_argument(annotation_prefix + ": expected " + std::to_string(initial.size())
                                    + " initial terms, got " + std::to_string(values.size()));
    }
    check_initial_terms(values);

    for (size_t i = 0; i < values.size(); ++i){
        pb.val(initial[i]) = field_from_ulong<FieldT>(values[i]);
    }
    generate_gadget_witness();
}

template<typename FieldT>
void recurrence_circuit<FieldT>::claim_output(uint64_t value)
{
    pb.val(out) = field_from_ulong<FieldT>(value);
}


template<typename FieldT>
const size_t fibonacci_chain_circuit<FieldT>::NUM_INITIAL_TERMS;

template<typename FieldT>
std::vector<uint64_t> fibonacci_chain_circuit<FieldT>::native_terms(const std::vector<uint64_t> &values,
                                                                    const circuit_parameters &params)
{
    assert(values.size() == NUM_INITIAL_TERMS);
    return fibonacci_sequence(values[0], values[1], params.steps);
}

template<typename FieldT>
fibonacci_chain_circuit<FieldT>::fibonacci_chain_circuit(const circuit_parameters &params,
                                                         const std::string &annotation_prefix)
        : recurrence_circuit<FieldT>(NUM_INITIAL_TERMS, params, annotation_prefix)
{
    check_min_steps(params, 2, name());
    g.reset(new fibonacci_chain_gadget<FieldT>(this->pb, params.steps, this->initial[0], this->initial[1], this->out,
                                               FMT(annotation_prefix, ".chain")));
    g->generate_r1cs_constraints();
    this->finalize();
}


template<typename FieldT>
const size_t fibonacci_sequence_circuit<FieldT>::NUM_INITIAL_TERMS;

template<typename FieldT>
std::vector<uint64_t> fibonacci_sequence_circuit<FieldT>::native_terms(const std::vector<uint64_t> &values,
                                                                       const circuit_parameters &params)
{
    assert(values.size() == NUM_INITIAL_TERMS);
    return fibonacci_sequence(values[0], values[1], params.steps);
}

template<typename FieldT>
fibonacci_sequence_circuit<FieldT>::fibonacci_sequence_circuit(const circuit_parameters &params,
                                                               const std::string &annotation_prefix)
        : recurrence_circuit<FieldT>(NUM_INITIAL_TERMS, params, annotation_prefix)
{
    check_min_steps(params, 2, name());
    g.reset(new fibonacci_sequence_gadget<FieldT>(this->pb, params.steps, this->initial[0], this->initial[1], this->out,
                                                  FMT(annotation_prefix, ".sequence")));
    g->generate_r1cs_constraints();
    this->finalize();
}


template<typename FieldT>
const size_t xor_fibonacci_circuit<FieldT>::NUM_INITIAL_TERMS;

template<typename FieldT>
std::vector<uint64_t> xor_fibonacci_circuit<FieldT>::native_terms(const std::vector<uint64_t> &values,
                                                                  const circuit_parameters &params)
{
    assert(values.size() == NUM_INITIAL_TERMS);
    return xor_fibonacci_sequence(values[0], values[1], values[2], params.steps);
}

template<typename FieldT>
xor_fibonacci_circuit<FieldT>::xor_fibonacci_circuit(const circuit_parameters &params,
                                                     const std::string &annotation_prefix)
        : recurrence_circuit<FieldT>(NUM_INITIAL_TERMS, params, annotation_prefix)
{
    check_min_steps(params, 3, name());
    check_word_bits(params, name());
    g.reset(new xor_fibonacci_gadget<FieldT>(this->pb, params.steps, params.word_bits, this->initial, this->out,
                                             FMT(annotation_prefix, ".xor_fibonacci")));
    g->generate_r1cs_constraints();
    this->finalize();
}

template<typename FieldT>
void xor_fibonacci_circuit<FieldT>::check_initial_terms(const std::vector<uint64_t> &values) const
{
    // t[0] .. t[steps-1] are initial terms or xor operands, t[steps] is left to the field
    const size_t last = this->params.steps - 1;
    const std::vector<uint64_t> t = (last < NUM_INITIAL_TERMS) ? values
            : xor_fibonacci_sequence(values[0], values[1], values[2], last);
    for (size_t j = 0; j <= last; ++j){
        check_fits_word(t[j], j, this->params.word_bits);
    }
}


template<typename FieldT>
const size_t alternating_fibonacci_circuit<FieldT>::NUM_INITIAL_TERMS;

template<typename FieldT>
std::vector<uint64_t> alternating_fibonacci_circuit<FieldT>::native_terms(const std::vector<uint64_t> &values,
                                                                          const circuit_parameters &params)
{
    assert(values.size() == NUM_INITIAL_TERMS);
    return alternating_fibonacci_sequence(values[0], values[1], params.steps);
}

template<typename FieldT>
alternating_fibonacci_circuit<FieldT>::alternating_fibonacci_circuit(const circuit_parameters &params,
                                                                     const std::string &annotation_prefix)
        : recurrence_circuit<FieldT>(NUM_INITIAL_TERMS, params, annotation_prefix)
{
    check_min_steps(params, 2, name());
    check_word_bits(params, name());
    g.reset(new alternating_fibonacci_gadget<FieldT>(this->pb, params.steps, params.word_bits,
                                                     this->initial[0], this->initial[1], this->out,
                                                     FMT(annotation_prefix, ".alternating")));
    g->generate_r1cs_constraints();
    this->finalize();
}

template<typename FieldT>
void alternating_fibonacci_circuit<FieldT>::check_initial_terms(const std::vector<uint64_t> &values) const
{
    const size_t last = this->params.steps - 1;
    const std::vector<uint64_t> t = (last < NUM_INITIAL_TERMS) ? values
            : alternating_fibonacci_sequence(values[0], values[1], last);
    check_fits_word(t[0], 0, this->params.word_bits);
    check_fits_word(t[1], 1, this->params.word_bits);

    // operands of the xor at odd k are t[k-2] and t[k-1]
    for (size_t k = 3; k <= this->params.steps; k += 2){
        check_fits_word(t[k-2], k-2, this->params.word_bits);
        check_fits_word(t[k-1], k-1, this->params.word_bits);
    }
}
