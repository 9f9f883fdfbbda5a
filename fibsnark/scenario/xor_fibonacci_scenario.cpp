/** @file
 *****************************************************************************

 Example 3: fib(i) = fib(i-3) + (fib(i-2) XOR fib(i-1)),
 fib(0) = 1, fib(1) = 3, fib(2) = 2

 XOR operands are unpacked to --word-bits bits.

 *****************************************************************************/

#include "fibsnark/scenario/scenario.hpp"

int main(int argc, char *argv[]) {
    return run_scenario<xor_fibonacci_circuit>(argc, argv);
}
