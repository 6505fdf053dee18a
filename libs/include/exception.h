//
// Created by the bayesnet authors on 10/17/26.
//

#ifndef BAYESNET_EXCEPTION_H
#define BAYESNET_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace bayesnet {

    // invalid construction parameters or call arguments (batch/model count, missing indices, unknown names)
    class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string &msg) : std::invalid_argument(msg) {};
    };

    // tensor rank or shape does not match what the call expects
    class ShapeError : public std::logic_error {
    public:
        explicit ShapeError(const std::string &msg) : std::logic_error(msg) {};
    };

}

#endif //BAYESNET_EXCEPTION_H
