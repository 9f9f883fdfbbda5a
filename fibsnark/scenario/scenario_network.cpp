/** @file
*****************************************************************************

Message passing between the parties of a proving scenario.

See scenario_network.h

*****************************************************************************/

#include "scenario_network.h"

std::string Communicator::handle(const std::string &topic, const std::string &from, const std::string &to) const {
    const std::string name = topic + "_" + from + "_" + to;
    if (mode == File){
        return directory + "/" + name;
    }
    return name;
}

bool Communicator::has_message(const std::string &topic, const std::string &from, const std::string &to) const {
    const std::string h = handle(topic, from, to);
    if (mode == File){
        std::ifstream input_file(h);
        return input_file.good();
    }
    return map.count(h) > 0;
}
