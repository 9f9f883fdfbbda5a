/** @file
 *****************************************************************************

 Example 2: fibo(n) = fibo(n-1) + fibo(n-2), fibo(0) = fibo(1) = 1

 The circuit is a single gadget over the whole term array, the public
 inputs are bound to its first two and its last entry.

 *****************************************************************************/

#include "fibsnark/scenario/scenario.hpp"

int main(int argc, char *argv[]) {
    return run_scenario<fibonacci_sequence_circuit>(argc, argv);
}
