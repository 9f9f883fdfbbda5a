/** @file
 *****************************************************************************

 Parties of a proving scenario

 Generator: builds the circuit, generates the Groth16 keypair and sends the
 proving key to the prover and the verification key to the verifier.
 Generator is assumed to be honest.

 Prover: computes the recurrence inside the circuit from the initial terms
 and sends the public inputs together with a proof. A claimed output
 replaces the computed one in the public inputs, the proof is still made
 for the honest witness. A witness that does not satisfy the constraints
 is not proved and nothing is sent.

 Verifier: checks the proof against the public inputs.

 *****************************************************************************/

#ifndef SNARK_PARTIES_HPP
#define SNARK_PARTIES_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include "libff/common/profiling.hpp"
#include "libff/algebra/curves/public_params.hpp"
#include "libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp"

#include "fibsnark/circuits/recurrence_circuit.hpp"
#include "fibsnark/gadgets/utils.h"
#include "scenario_network.h"

template<typename ppT, template<typename> class CircuitT>
class Generator : NetworkParticipant {
private:
    const circuit_parameters params;

public:
    Generator(const circuit_parameters &params, const std::string &name, Communicator &comm) :
        NetworkParticipant(name, comm), params(params)
        {}
    void setup();
};

template<typename ppT, template<typename> class CircuitT>
void Generator<ppT, CircuitT>::setup(){
    CircuitT<libff::Fr<ppT>> circuit(params, name);
    libff::enter_block("Generator setup");

    libsnark::r1cs_gg_ppzksnark_keypair<ppT> keypair = libsnark::r1cs_gg_ppzksnark_generator<ppT>(circuit.constraint_system());

    this->send_to(keypair.pk, "pk", "Prover");
    this->send_to(keypair.vk, "vk", "Verifier");
    libff::leave_block("Generator setup");
}

template<typename ppT, template<typename> class CircuitT>
class Prover : NetworkParticipant {
private:
    typedef libff::Fr<ppT> FieldT;

    const circuit_parameters params;
    libsnark::r1cs_gg_ppzksnark_proving_key<ppT> pk;
    std::shared_ptr<CircuitT<FieldT>> circuit;

public:
    Prover(const circuit_parameters &params, const std::string &name, Communicator &comm) :
        NetworkParticipant(name, comm), params(params)
        {}
    void setup(); // Receive proving key
    // false if the witness does not satisfy the constraints
    bool run(const std::vector<uint64_t> &initial_terms, const boost::optional<uint64_t> &claim=boost::none);

    const CircuitT<FieldT> &get_circuit() const { return *circuit; }
};

template<typename ppT, template<typename> class CircuitT>
void Prover<ppT, CircuitT>::setup(){
    pk = this->receive_from<libsnark::r1cs_gg_ppzksnark_proving_key<ppT>>("pk", "Generator");
    circuit.reset(new CircuitT<FieldT>(params, name));
}

template<typename ppT, template<typename> class CircuitT>
bool Prover<ppT, CircuitT>::run(const std::vector<uint64_t> &initial_terms, const boost::optional<uint64_t> &claim){
    if (!circuit){
        throw std::logic_error("Prover: run before setup");
    }
    circuit->generate_r1cs_witness(initial_terms);

    libff::enter_block("Prover run");
    const bool satisfied = circuit->is_satisfied();
    if (!libff::inhibit_profiling_info){
        std::cout << name << ": output " << field_to_string(circuit->output_value())
                  << ", constraints satisfied: " << satisfied << std::endl;
    }
    if (!satisfied){
        std::cerr << name << ": witness does not satisfy the constraints" << std::endl;
        libff::leave_block("Prover run");
        return false;
    }

    const libsnark::r1cs_gg_ppzksnark_proof<ppT> proof = libsnark::r1cs_gg_ppzksnark_prover<ppT>(pk,
                                                                                  circuit->primary_input(),
                                                                                  circuit->auxiliary_input());

    libsnark::r1cs_gg_ppzksnark_primary_input<ppT> primary_input = circuit->primary_input();
    if (claim){
        primary_input.back() = field_from_ulong<FieldT>(*claim);
    }

    this->send_to(primary_input, "values", "Verifier");
    this->send_to(proof, "proof", "Verifier");
    libff::leave_block("Prover run");
    return true;
}

template<typename ppT>
class Verifier : NetworkParticipant {
private:
    typedef libff::Fr<ppT> FieldT;

    libsnark::r1cs_gg_ppzksnark_processed_verification_key<ppT> pvk;
    libsnark::r1cs_gg_ppzksnark_primary_input<ppT> last_primary_input;

public:
    int confirmed_count;
    int error_count;
    Verifier(const std::string &name, Communicator &comm) :
    NetworkParticipant(name, comm), confirmed_count(0), error_count(0) {}
    void setup();
    bool run();

    // public inputs of the last checked proof, initial terms then output
    const libsnark::r1cs_gg_ppzksnark_primary_input<ppT> &primary_input() const { return last_primary_input; }
};

template<typename ppT>
void Verifier<ppT>::setup(){
    const auto vk = this->receive_from<libsnark::r1cs_gg_ppzksnark_verification_key<ppT>>("vk", "Generator");
    pvk = libsnark::r1cs_gg_ppzksnark_verifier_process_vk<ppT>(vk);
}

template<typename ppT>
bool Verifier<ppT>::run(){
    last_primary_input = this->receive_from<libsnark::r1cs_gg_ppzksnark_primary_input<ppT>>("values", "Prover");
    const auto proof = this->receive_from<libsnark::r1cs_gg_ppzksnark_proof<ppT>>("proof", "Prover");

    libff::enter_block("Verifier run");

    const bool verified = libsnark::r1cs_gg_ppzksnark_online_verifier_strong_IC<ppT>(pvk, last_primary_input, proof);
    if (!verified){
        std::cerr << "SNARK does not verify" << std::endl;
        error_count++;
    }else{
        confirmed_count++;
    }
    libff::leave_block("Verifier run");
    return verified;
}

#endif //SNARK_PARTIES_HPP
