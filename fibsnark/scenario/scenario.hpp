/** @file
 *****************************************************************************

 Command line driver shared by the example programs

 Runs a recurrence circuit either as a plain constraint check or through the
 full Generator -> Prover -> Verifier flow.

 Exit status: 0 accepted, 1 usage or parameter error, 2 constraints not
 satisfied or proof rejected.

 *****************************************************************************/

#ifndef SCENARIO_HPP
#define SCENARIO_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "libff/common/default_types/ec_pp.hpp"
#include "libff/common/profiling.hpp"

#include "fibsnark/circuits/recurrence_circuit.hpp"
#include "fibsnark/gadgets/utils.h"
#include "snark_parties.hpp"
#include "scenario_network.h"

typedef libff::default_ec_pp EcPP;
typedef libff::Fr<EcPP> SFieldT;

template<template<typename> class CircuitT>
int check_constraints(const circuit_parameters &params,
                      const std::vector<uint64_t> &initial_terms,
                      const boost::optional<uint64_t> &claim)
{
    CircuitT<SFieldT> circuit(params, CircuitT<SFieldT>::name());
    circuit.generate_r1cs_witness(initial_terms);
    if (claim){
        circuit.claim_output(*claim);
    }

    const bool satisfied = circuit.is_satisfied();
    std::cout << "Output: " << field_to_string(circuit.output_value())
              << " Constraints satisfied: " << satisfied << std::endl;
    return satisfied ? 0 : 2;
}

template<template<typename> class CircuitT>
int prove_and_verify(const circuit_parameters &params,
                     const std::vector<uint64_t> &initial_terms,
                     const boost::optional<uint64_t> &claim,
                     Communicator &communicator)
{
    Generator<EcPP, CircuitT> gen(params, "Generator", communicator);
    Prover<EcPP, CircuitT> prover(params, "Prover", communicator);
    Verifier<EcPP> ver("Verifier", communicator);

    long long start_time, end_time;

    start_time = libff::get_nsec_time();
    gen.setup();
    prover.setup();
    ver.setup();

    if (!prover.run(initial_terms, claim)){
        return 2;
    }
    const bool verified = ver.run();
    end_time = libff::get_nsec_time();

    std::cout << "Constraints: " << prover.get_circuit().num_constraints()
              << " Output: " << field_to_string(ver.primary_input().back())
              << " Verified: " << verified << std::endl;
    std::cout << "Duration: " << (end_time - start_time) / 1000 << "us" << std::endl;
    return verified ? 0 : 2;
}

template<template<typename> class CircuitT>
int run_scenario(int argc, char *argv[])
{
    typedef CircuitT<SFieldT> circuit_type;
    namespace po = boost::program_options;

    circuit_parameters params = circuit_type::default_parameters();
    std::vector<uint64_t> initial_terms = circuit_type::default_initial_terms();
    uint64_t claimed_output = 0;
    std::string directory;

    std::cout << circuit_type::name() << std::endl;
    po::options_description desc("Usage");
    po::variables_map vm;
    desc.add_options()
            ("help", "show help")
            ("steps", po::value<size_t>(&params.steps)->default_value(params.steps), "index of the proved term")
            ("f0", po::value<uint64_t>(&initial_terms[0])->default_value(initial_terms[0]), "initial term t[0]")
            ("f1", po::value<uint64_t>(&initial_terms[1])->default_value(initial_terms[1]), "initial term t[1]");
    if (circuit_type::NUM_INITIAL_TERMS > 2){
        desc.add_options()
            ("f2", po::value<uint64_t>(&initial_terms[2])->default_value(initial_terms[2]), "initial term t[2]");
    }
    if (params.word_bits > 0){
        desc.add_options()
            ("word-bits", po::value<size_t>(&params.word_bits)->default_value(params.word_bits), "bit width of xor operands");
    }
    desc.add_options()
            ("claim", po::value<uint64_t>(&claimed_output), "claimed output, the computed value if omitted")
            ("check", "only check the constraints, no keys and no proof")
            ("file", "exchange keys and proofs through files")
            ("dir", po::value<std::string>(&directory)->default_value("."), "directory used with --file")
            ("verbose", "print profiling information");

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 1;
    }

    EcPP::init_public_params();

    // Disable profiling
    if (!vm.count("verbose")){
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
    }

    boost::optional<uint64_t> claim;
    if (vm.count("claim")){
        claim = claimed_output;
    }

    libff::print_header(circuit_type::name());

    try {
        const std::vector<uint64_t> expected = circuit_type::native_terms(initial_terms, params);
        std::cout << "Initial terms:";
        for (const uint64_t t : initial_terms){
            std::cout << " " << t;
        }
        std::cout << " Steps: " << params.steps << " Expected t[" << params.steps << "] = " << expected.back();
        if (claim){
            std::cout << " Claimed: " << *claim;
        }
        std::cout << std::endl;

        if (vm.count("check")){
            return check_constraints<CircuitT>(params, initial_terms, claim);
        }

        Communicator communicator(vm.count("file") ? Communicator::File : Communicator::Ram, directory);
        return prove_and_verify<CircuitT>(params, initial_terms, claim, communicator);
    } catch (const std::exception &e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}

#endif //SCENARIO_HPP
