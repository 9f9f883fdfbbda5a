/** @file
 *****************************************************************************

 Example 1: fibo(n) = fibo(n-1) + fibo(n-2), fibo(0) = fibo(1) = 1

 The circuit has one addition row per step. Each row reads the outputs of
 the two rows before it. fibo(0), fibo(1) and fibo(n) are public inputs.

 *****************************************************************************/

#include "fibsnark/scenario/scenario.hpp"

int main(int argc, char *argv[]) {
    return run_scenario<fibonacci_chain_circuit>(argc, argv);
}
