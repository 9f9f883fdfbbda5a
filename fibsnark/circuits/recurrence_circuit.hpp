/** @file
 *****************************************************************************

 Protoboard setups for the recurrence examples

 Each circuit owns a protoboard, allocates its public inputs first
 (initial terms, then the final term), builds its gadget and generates the
 constraints on construction. Witnesses are generated from the initial
 terms.

 fibonacci_chain_circuit:       Example 1, one step gadget per row
 fibonacci_sequence_circuit:    Example 2, one gadget over the term array
 xor_fibonacci_circuit:         Example 3, t[i] = t[i-3] + (t[i-2] ^ t[i-1])
 alternating_fibonacci_circuit: add on even, xor on odd indices

 *****************************************************************************/

#ifndef RECURRENCE_CIRCUIT_H
#define RECURRENCE_CIRCUIT_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp"

#include "fibsnark/gadgets/fibonacci_gadgets.hpp"
#include "fibsnark/gadgets/recurrence_gadgets.hpp"
#include "fibsnark/gadgets/utils.h"
#include "fibsnark/circuits/recurrences.h"

struct circuit_parameters {
    size_t steps;
    size_t word_bits;
};

template<typename FieldT>
class recurrence_circuit {
public:
    libsnark::protoboard<FieldT> pb;

protected:
    libsnark::pb_variable_array<FieldT> initial;
    libsnark::pb_variable<FieldT> out;

    recurrence_circuit(const size_t num_initial, const circuit_parameters &params, const std::string &annotation_prefix);

    // called once the gadget constraints exist, fixes the primary input size
    void finalize();

    virtual void check_initial_terms(const std::vector<uint64_t> &) const {}
    virtual void generate_gadget_witness() = 0;

public:
    const circuit_parameters params;
    const std::string annotation_prefix;

    virtual ~recurrence_circuit() = default;

    void generate_r1cs_witness(const std::vector<uint64_t> &values);

    // overwrites the public output, as a dishonest prover would
    void claim_output(uint64_t value);

    const libsnark::pb_variable_array<FieldT> &initial_terms() const { return initial; }
    const libsnark::pb_variable<FieldT> &output() const { return out; }
    FieldT output_value() const { return pb.val(out); }
    size_t num_initial_terms() const { return initial.size(); }
    size_t num_public_inputs() const { return initial.size() + 1; }

    libsnark::r1cs_primary_input<FieldT> primary_input() const { return pb.primary_input(); }
    libsnark::r1cs_auxiliary_input<FieldT> auxiliary_input() const { return pb.auxiliary_input(); }
    libsnark::r1cs_constraint_system<FieldT> constraint_system() const { return pb.get_constraint_system(); }
    bool is_satisfied() const { return pb.is_satisfied(); }
    size_t num_constraints() const { return pb.num_constraints(); }
};

template<typename FieldT>
class fibonacci_chain_circuit : public recurrence_circuit<FieldT> {
private:
    std::shared_ptr<fibonacci_chain_gadget<FieldT>> g;

protected:
    void generate_gadget_witness() override { g->generate_r1cs_witness(); }

public:
    static const size_t NUM_INITIAL_TERMS = 2;
    static const char *name() { return "fibonacci_chain"; }
    static circuit_parameters default_parameters() { return {9, 0}; }
    static std::vector<uint64_t> default_initial_terms() { return {1, 1}; }
    static std::vector<uint64_t> native_terms(const std::vector<uint64_t> &values, const circuit_parameters &params);

    fibonacci_chain_circuit(const circuit_parameters &params, const std::string &annotation_prefix="");

    size_t num_rows() const { return g->num_rows(); }
};

template<typename FieldT>
class fibonacci_sequence_circuit : public recurrence_circuit<FieldT> {
private:
    std::shared_ptr<fibonacci_sequence_gadget<FieldT>> g;

protected:
    void generate_gadget_witness() override { g->generate_r1cs_witness(); }

public:
    static const size_t NUM_INITIAL_TERMS = 2;
    static const char *name() { return "fibonacci_sequence"; }
    static circuit_parameters default_parameters() { return {9, 0}; }
    static std::vector<uint64_t> default_initial_terms() { return {1, 1}; }
    static std::vector<uint64_t> native_terms(const std::vector<uint64_t> &values, const circuit_parameters &params);

    fibonacci_sequence_circuit(const circuit_parameters &params, const std::string &annotation_prefix="");

    // t[i] as assigned by the last witness generation
    FieldT term_value(size_t i) const { return this->pb.val(g->terms[i]); }
};

template<typename FieldT>
class xor_fibonacci_circuit : public recurrence_circuit<FieldT> {
private:
    std::shared_ptr<xor_fibonacci_gadget<FieldT>> g;

protected:
    void check_initial_terms(const std::vector<uint64_t> &values) const override;
    void generate_gadget_witness() override { g->generate_r1cs_witness(); }

public:
    static const size_t NUM_INITIAL_TERMS = 3;
    static const char *name() { return "xor_fibonacci"; }
    static circuit_parameters default_parameters() { return {9, 32}; }
    static std::vector<uint64_t> default_initial_terms() { return {1, 3, 2}; }
    static std::vector<uint64_t> native_terms(const std::vector<uint64_t> &values, const circuit_parameters &params);

    xor_fibonacci_circuit(const circuit_parameters &params, const std::string &annotation_prefix="");
};

template<typename FieldT>
class alternating_fibonacci_circuit : public recurrence_circuit<FieldT> {
private:
    std::shared_ptr<alternating_fibonacci_gadget<FieldT>> g;

protected:
    void check_initial_terms(const std::vector<uint64_t> &values) const override;
    void generate_gadget_witness() override { g->generate_r1cs_witness(); }

public:
    static const size_t NUM_INITIAL_TERMS = 2;
    static const char *name() { return "alternating_fibonacci"; }
    static circuit_parameters default_parameters() { return {9, 32}; }
    static std::vector<uint64_t> default_initial_terms() { return {1, 1}; }
    static std::vector<uint64_t> native_terms(const std::vector<uint64_t> &values, const circuit_parameters &params);

    alternating_fibonacci_circuit(const circuit_parameters &params, const std::string &annotation_prefix="");
};


#include "recurrence_circuit.tcc"
#endif //RECURRENCE_CIRCUIT_H
