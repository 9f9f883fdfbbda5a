/**
 * @file test_recurrence_circuit.cpp
 * @brief Tests for the protoboard setups of the four examples.
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "libff/common/default_types/ec_pp.hpp"

#include "fibsnark/circuits/recurrence_circuit.hpp"

typedef libff::Fr<libff::default_ec_pp> FieldT;

/** @brief Test: public inputs are the initial terms followed by the output */
TEST(FibonacciChainCircuit, PublicInputLayout) {
    fibonacci_chain_circuit<FieldT> circuit({9, 0}, "chain");
    EXPECT_EQ(circuit.num_public_inputs(), 3u);
    EXPECT_EQ(circuit.num_rows(), 8u);
    EXPECT_EQ(circuit.num_constraints(), 8u);

    circuit.generate_r1cs_witness({1, 1});
    const libsnark::r1cs_primary_input<FieldT> input = circuit.primary_input();
    ASSERT_EQ(input.size(), 3u);
    EXPECT_EQ(input[0], FieldT(1));
    EXPECT_EQ(input[1], FieldT(1));
    EXPECT_EQ(input[2], FieldT(55));
    EXPECT_TRUE(circuit.is_satisfied());
}

/** @brief Test: a claimed output other than the computed one fails */
TEST(FibonacciChainCircuit, DishonestClaim) {
    fibonacci_chain_circuit<FieldT> circuit({9, 0}, "chain");
    circuit.generate_r1cs_witness({1, 1});
    circuit.claim_output(56);
    EXPECT_FALSE(circuit.is_satisfied());

    circuit.claim_output(55);
    EXPECT_TRUE(circuit.is_satisfied());
}

/** @brief Test: steps below two are rejected */
TEST(FibonacciChainCircuit, TooFewSteps) {
    EXPECT_THROW(fibonacci_chain_circuit<FieldT>({1, 0}, "chain"), std::invalid_argument);
}

/** @brief Test: wrong number of initial terms */
TEST(FibonacciChainCircuit, WrongInitialTermCount) {
    fibonacci_chain_circuit<FieldT> circuit({9, 0}, "chain");
    EXPECT_THROW(circuit.generate_r1cs_witness({1, 1, 2}), std::invalid_argument);
}

/** @brief Test: both fibonacci circuits agree with the native sequence */
TEST(FibonacciSequenceCircuit, MatchesNativeTerms) {
    const circuit_parameters params = {20, 0};
    const std::vector<uint64_t> initial = {2, 7};
    const std::vector<uint64_t> native = fibonacci_sequence_circuit<FieldT>::native_terms(initial, params);

    fibonacci_sequence_circuit<FieldT> sequence(params, "sequence");
    sequence.generate_r1cs_witness(initial);
    EXPECT_TRUE(sequence.is_satisfied());
    for (size_t i = 0; i <= params.steps; ++i){
        EXPECT_EQ(sequence.term_value(i), field_from_ulong<FieldT>(native[i])) << "t[" << i << "]";
    }

    fibonacci_chain_circuit<FieldT> chain(params, "chain");
    chain.generate_r1cs_witness(initial);
    EXPECT_EQ(chain.output_value(), sequence.output_value());
    EXPECT_EQ(field_to_ulong(chain.output_value()), native.back());
}

/** @brief Test: terms beyond 64 bits are computed in the field */
TEST(FibonacciSequenceCircuit, BeyondMachineWord) {
    fibonacci_sequence_circuit<FieldT> circuit({100, 0}, "sequence");
    circuit.generate_r1cs_witness({1, 1});
    EXPECT_TRUE(circuit.is_satisfied());
    EXPECT_FALSE(field_fits_ulong(circuit.output_value()));
    // fibo(100) = F(101) = 573147844013817084101
    EXPECT_EQ(field_to_string(circuit.output_value()), "573147844013817084101");
}

/** @brief Test: default parameters prove t[9] = 15 */
TEST(XorFibonacciCircuit, DefaultParameters) {
    xor_fibonacci_circuit<FieldT> circuit(xor_fibonacci_circuit<FieldT>::default_parameters(), "xor_fibonacci");
    EXPECT_EQ(circuit.num_public_inputs(), 4u);

    circuit.generate_r1cs_witness(xor_fibonacci_circuit<FieldT>::default_initial_terms());
    EXPECT_TRUE(circuit.is_satisfied());
    EXPECT_EQ(circuit.output_value(), FieldT(15));

    const libsnark::r1cs_primary_input<FieldT> input = circuit.primary_input();
    ASSERT_EQ(input.size(), 4u);
    EXPECT_EQ(input[0], FieldT(1));
    EXPECT_EQ(input[1], FieldT(3));
    EXPECT_EQ(input[2], FieldT(2));
    EXPECT_EQ(input[3], FieldT(15));
}

/** @brief Test: twenty steps from 1, 3, 2 */
TEST(XorFibonacciCircuit, TwentySteps) {
    xor_fibonacci_circuit<FieldT> circuit({20, 16}, "xor_fibonacci");
    circuit.generate_r1cs_witness({1, 3, 2});
    EXPECT_TRUE(circuit.is_satisfied());
    EXPECT_EQ(circuit.output_value(), FieldT(595));
}

/** @brief Test: claimed output is rejected */
TEST(XorFibonacciCircuit, DishonestClaim) {
    xor_fibonacci_circuit<FieldT> circuit({9, 32}, "xor_fibonacci");
    circuit.generate_r1cs_witness({1, 3, 2});
    circuit.claim_output(14);
    EXPECT_FALSE(circuit.is_satisfied());
}

/** @brief Test: operands must fit the word width */
TEST(XorFibonacciCircuit, OperandExceedsWord) {
    // t[8] = 9 is an operand of t[9] and needs four bits
    xor_fibonacci_circuit<FieldT> circuit({9, 3}, "xor_fibonacci");
    EXPECT_THROW(circuit.generate_r1cs_witness({1, 3, 2}), std::overflow_error);

    xor_fibonacci_circuit<FieldT> wide({9, 4}, "xor_fibonacci");
    EXPECT_NO_THROW(wide.generate_r1cs_witness({1, 3, 2}));
    EXPECT_TRUE(wide.is_satisfied());
}

/** @brief Test: invalid word widths and step counts */
TEST(XorFibonacciCircuit, InvalidParameters) {
    EXPECT_THROW(xor_fibonacci_circuit<FieldT>({9, 0}, "xor_fibonacci"), std::invalid_argument);
    EXPECT_THROW(xor_fibonacci_circuit<FieldT>({9, 65}, "xor_fibonacci"), std::invalid_argument);
    EXPECT_THROW(xor_fibonacci_circuit<FieldT>({2, 32}, "xor_fibonacci"), std::invalid_argument);
}

/** @brief Test: alternating recurrence from 1, 1 ends at 21 */
TEST(AlternatingFibonacciCircuit, DefaultParameters) {
    alternating_fibonacci_circuit<FieldT> circuit(alternating_fibonacci_circuit<FieldT>::default_parameters(),
                                                  "alternating");
    circuit.generate_r1cs_witness(alternating_fibonacci_circuit<FieldT>::default_initial_terms());
    EXPECT_TRUE(circuit.is_satisfied());
    EXPECT_EQ(circuit.output_value(), FieldT(21));

    circuit.claim_output(34);
    EXPECT_FALSE(circuit.is_satisfied());
}

/** @brief Test: the final term is not an operand and may leave the machine word */
TEST(XorFibonacciCircuit, OutputBeyondMachineWord) {
    xor_fibonacci_circuit<FieldT> circuit({3, 64}, "xor_fibonacci");
    circuit.generate_r1cs_witness({UINT64_MAX, 1, 0});
    EXPECT_TRUE(circuit.is_satisfied());
    EXPECT_FALSE(field_fits_ulong(circuit.output_value()));
    EXPECT_EQ(field_to_string(circuit.output_value()), "18446744073709551616");
}

/** @brief Test: every initial term must fit the word, read by an xor or not */
TEST(XorFibonacciCircuit, InitialTermExceedsWord) {
    xor_fibonacci_circuit<FieldT> circuit({9, 8}, "xor_fibonacci");
    EXPECT_THROW(circuit.generate_r1cs_witness({1000, 3, 2}), std::overflow_error);
    EXPECT_THROW(circuit.generate_r1cs_witness({1, 3, 256}), std::overflow_error);

    // t[3] = 255 + (3 ^ 2) = 256 is the output only
    xor_fibonacci_circuit<FieldT> short_run({3, 8}, "xor_fibonacci");
    EXPECT_NO_THROW(short_run.generate_r1cs_witness({255, 3, 2}));
    EXPECT_TRUE(short_run.is_satisfied());
    EXPECT_EQ(short_run.output_value(), FieldT(256));
}

/** @brief Test: the overflow message names the term and its width */
TEST(XorFibonacciCircuit, OperandWidthMessage) {
    xor_fibonacci_circuit<FieldT> circuit({9, 3}, "xor_fibonacci");
    try {
        circuit.generate_r1cs_witness({1, 3, 2});
        FAIL() << "expected std::overflow_error";
    } catch (const std::overflow_error &e) {
        EXPECT_EQ(std::string(e.what()), "term 8 = 9 needs 4 bits, word is 3 bits");
    }
}

/** @brief Test: a two step run has no xor, its output is computed in the field */
TEST(AlternatingFibonacciCircuit, OutputBeyondMachineWord) {
    alternating_fibonacci_circuit<FieldT> circuit({2, 64}, "alternating");
    circuit.generate_r1cs_witness({UINT64_MAX, 1});
    EXPECT_TRUE(circuit.is_satisfied());
    EXPECT_EQ(field_to_string(circuit.output_value()), "18446744073709551616");
}

/** @brief Test: initial terms are checked even without an xor reading them */
TEST(AlternatingFibonacciCircuit, InitialTermExceedsWord) {
    alternating_fibonacci_circuit<FieldT> two_steps({2, 8}, "alternating");
    EXPECT_THROW(two_steps.generate_r1cs_witness({1, 1000}), std::overflow_error);
    EXPECT_THROW(two_steps.generate_r1cs_witness({1000, 1}), std::overflow_error);

    alternating_fibonacci_circuit<FieldT> nine_steps({9, 8}, "alternating");
    EXPECT_THROW(nine_steps.generate_r1cs_witness({300, 1}), std::overflow_error);
}

/** @brief Test: an even index sum at the end is not range checked */
TEST(AlternatingFibonacciCircuit, EvenOutputNotChecked) {
    // t = 200, 100, 300: t[2] exceeds 8 bits but is only the output
    alternating_fibonacci_circuit<FieldT> circuit({2, 8}, "alternating");
    EXPECT_NO_THROW(circuit.generate_r1cs_witness({200, 100}));
    EXPECT_TRUE(circuit.is_satisfied());
    EXPECT_EQ(circuit.output_value(), FieldT(300));
}
