/** @file
 *****************************************************************************

 Alternating recurrence: t(k) = t(k-2) + t(k-1) for even k and
 t(k) = t(k-2) XOR t(k-1) for odd k, t(0) = t(1) = 1

 With the default 9 steps the proved output is 21.

 *****************************************************************************/

#include "fibsnark/scenario/scenario.hpp"

int main(int argc, char *argv[]) {
    return run_scenario<alternating_fibonacci_circuit>(argc, argv);
}
