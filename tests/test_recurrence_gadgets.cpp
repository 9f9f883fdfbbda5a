/**
 * @file test_recurrence_gadgets.cpp
 * @brief Tests for the xor recurrence gadgets.
 */

#include <gtest/gtest.h>

#include "libff/common/default_types/ec_pp.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"

#include "fibsnark/gadgets/recurrence_gadgets.hpp"

typedef libff::Fr<libff::default_ec_pp> FieldT;

/** @brief Test: t[i] = t[i-3] + (t[i-2] ^ t[i-1]) from 1, 3, 2 */
TEST(XorFibonacciGadget, HonestWitness) {
    libsnark::protoboard<FieldT> pb;
    libsnark::pb_variable_array<FieldT> initial;
    libsnark::pb_variable<FieldT> out;
    initial.allocate(pb, 3, "initial");
    out.allocate(pb, "out");
    pb.set_input_sizes(4);

    xor_fibonacci_gadget<FieldT> g(pb, 9, 8, initial, out, "xor_fibonacci");
    g.generate_r1cs_constraints();

    pb.val(initial[0]) = FieldT(1);
    pb.val(initial[1]) = FieldT(3);
    pb.val(initial[2]) = FieldT(2);
    g.generate_r1cs_witness();

    const long expected[] = {1, 3, 2, 2, 3, 3, 2, 4, 9, 15};
    for (size_t i = 0; i <= 9; ++i){
        EXPECT_EQ(pb.val(g.terms[i]), FieldT(expected[i])) << "t[" << i << "]";
    }
    EXPECT_EQ(pb.val(out), FieldT(15));
    EXPECT_TRUE(pb.is_satisfied());
}

/** @brief Test: the output is bound to the recurrence */
TEST(XorFibonacciGadget, WrongOutput) {
    libsnark::protoboard<FieldT> pb;
    libsnark::pb_variable_array<FieldT> initial;
    libsnark::pb_variable<FieldT> out;
    initial.allocate(pb, 3, "initial");
    out.allocate(pb, "out");
    pb.set_input_sizes(4);

    xor_fibonacci_gadget<FieldT> g(pb, 5, 8, initial, out, "xor_fibonacci");
    g.generate_r1cs_constraints();

    pb.val(initial[0]) = FieldT(1);
    pb.val(initial[1]) = FieldT(3);
    pb.val(initial[2]) = FieldT(2);
    g.generate_r1cs_witness();
    EXPECT_EQ(pb.val(out), FieldT(3));
    EXPECT_TRUE(pb.is_satisfied());

    pb.val(out) = FieldT(4);
    EXPECT_FALSE(pb.is_satisfied());
}

/** @brief Test: an operand wider than the word is rejected */
TEST(XorFibonacciGadget, OperandExceedsWord) {
    libsnark::protoboard<FieldT> pb;
    libsnark::pb_variable_array<FieldT> initial;
    libsnark::pb_variable<FieldT> out;
    initial.allocate(pb, 3, "initial");
    out.allocate(pb, "out");
    pb.set_input_sizes(4);

    xor_fibonacci_gadget<FieldT> g(pb, 3, 2, initial, out, "xor_fibonacci");
    g.generate_r1cs_constraints();

    pb.val(initial[0]) = FieldT(1);
    pb.val(initial[1]) = FieldT(4);
    pb.val(initial[2]) = FieldT(2);
    g.generate_r1cs_witness();
    EXPECT_FALSE(pb.is_satisfied());
}

/** @brief Test: add on even indices, xor on odd indices */
TEST(AlternatingFibonacciGadget, HonestWitness) {
    libsnark::protoboard<FieldT> pb;
    libsnark::pb_variable<FieldT> f0;
    libsnark::pb_variable<FieldT> f1;
    libsnark::pb_variable<FieldT> out;
    f0.allocate(pb, "f0");
    f1.allocate(pb, "f1");
    out.allocate(pb, "out");
    pb.set_input_sizes(3);

    alternating_fibonacci_gadget<FieldT> g(pb, 9, 16, f0, f1, out, "alternating");
    g.generate_r1cs_constraints();

    pb.val(f0) = FieldT(1);
    pb.val(f1) = FieldT(1);
    g.generate_r1cs_witness();

    const long expected[] = {1, 1, 2, 3, 5, 6, 11, 13, 24, 21};
    for (size_t i = 0; i <= 9; ++i){
        EXPECT_EQ(pb.val(g.terms[i]), FieldT(expected[i])) << "t[" << i << "]";
    }
    EXPECT_EQ(pb.val(out), FieldT(21));
    EXPECT_TRUE(pb.is_satisfied());
}

/** @brief Test: tampering with an intermediate term is detected */
TEST(AlternatingFibonacciGadget, TamperedTerm) {
    libsnark::protoboard<FieldT> pb;
    libsnark::pb_variable<FieldT> f0;
    libsnark::pb_variable<FieldT> f1;
    libsnark::pb_variable<FieldT> out;
    f0.allocate(pb, "f0");
    f1.allocate(pb, "f1");
    out.allocate(pb, "out");
    pb.set_input_sizes(3);

    alternating_fibonacci_gadget<FieldT> g(pb, 6, 16, f0, f1, out, "alternating");
    g.generate_r1cs_constraints();

    pb.val(f0) = FieldT(1);
    pb.val(f1) = FieldT(1);
    g.generate_r1cs_witness();
    EXPECT_EQ(pb.val(out), FieldT(11));
    EXPECT_TRUE(pb.is_satisfied());

    pb.val(g.terms[2]) = FieldT(3);
    EXPECT_FALSE(pb.is_satisfied());
}
