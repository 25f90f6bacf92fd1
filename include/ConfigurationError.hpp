//
// Created by moinshaikh on 2/11/26.
//

#ifndef PSPPO_CONFIGURATIONERROR_HPP
#define PSPPO_CONFIGURATIONERROR_HPP

#include<stdexcept>
#include<string>

namespace PsPpo
{
    /**
     * @brief Raised when a component is constructed with an invalid configuration.
     *
     * Covers invalid network depths, unknown activation names, unknown advantage
     * estimators and shared networks without a private head layer. These errors are
     * raised from constructors and are not recoverable.
     */
    class ConfigurationError : public std::runtime_error
    {
    public:
        explicit ConfigurationError(const std::string &message) : std::runtime_error(message) {}
    };
}

#endif //PSPPO_CONFIGURATIONERROR_HPP
