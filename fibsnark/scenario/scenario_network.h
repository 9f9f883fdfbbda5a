/** @file
*****************************************************************************

Message passing between the parties of a proving scenario

Parties are identified by name, messages are addressed by topic, sender and
receiver. Messages are kept in RAM (a std::map of boost::any) or written to
files in a directory. The latter exercises serialization and
deserialization of keys and proofs.
*****************************************************************************/

#ifndef SCENARIO_NETWORK_H
#define SCENARIO_NETWORK_H

#include <string>
#include <iostream>
#include <fstream>
#include <map>
#include <stdexcept>
#include <boost/any.hpp>

class Communicator {
private:
    std::map<std::string, boost::any> map;
    std::string directory;

    std::string handle(const std::string &topic, const std::string &from, const std::string &to) const;

public:
    enum CommunicationMode {File, Ram};

    CommunicationMode mode;

    explicit Communicator(CommunicationMode mode=Ram, const std::string &directory=".")
    :  directory(directory), mode(mode) {}

    template<typename T>
    void send_to(const T &content, const std::string &topic, const std::string &from, const std::string &to){
        const std::string h = handle(topic, from, to);
        if (mode == File){
            std::ofstream output_file(h, std::ios::out | std::ios::binary);
            if (!output_file){
                throw std::runtime_error("cannot open " + h + " for writing");
            }
            output_file << content;
        }else{
            map[h] = content;
        }
    }

    template<typename T>
    T receive_from(const std::string &topic, const std::string &from, const std::string &to){
        T content;
        const std::string h = handle(topic, from, to);
        if (mode == File){
            std::ifstream input_file(h, std::ios::in | std::ios::binary);
            if (!input_file){
                throw std::runtime_error("no message " + h);
            }
            input_file >> content;
            if (input_file.bad()){
                throw std::runtime_error("cannot read message " + h);
            }
        } else{
            auto it = map.find(h);
            if (it == map.end()){
                throw std::runtime_error("no message " + h);
            }
            content = boost::any_cast<T>(it->second);
        }
        return content;
    }

    bool has_message(const std::string &topic, const std::string &from, const std::string &to) const;
};

class NetworkParticipant {
private:
    Communicator &comm;

protected:
    template<typename T>
    void send_to(const T &content, const std::string &topic, const std::string &to) {
        comm.send_to<T>(content, topic, name, to);
    }

    template<typename T>
    T receive_from(const std::string &topic, const std::string &from) {
        return comm.receive_from<T>(topic, from, name);
    }

public:
    std::string name;
    NetworkParticipant(const std::string &name, Communicator &comm) : comm(comm), name(name)  {}
};



#endif //SCENARIO_NETWORK_H
